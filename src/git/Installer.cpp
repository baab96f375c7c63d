#include "Installer.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <fstream>
#include <ostream>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace git
{

namespace
{

using utils::ErrorCategory;
using utils::ErrorReporter;

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return std::string();
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool readFile(const fs::path& path, std::string& outContent)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    outContent = buffer.str();
    return true;
}

bool startsWith(const std::string& text, const char* prefix)
{
    return text.rfind(prefix, 0) == 0;
}

// Lines of `content` that mention `word`, joined and trimmed
std::string linesContaining(const std::string& content, const std::string& word)
{
    std::istringstream in(content);
    std::string line;
    std::string joined;
    while (std::getline(in, line))
    {
        if (line.find(word) != std::string::npos)
            joined += line + "\n";
    }
    return trim(joined);
}

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string missingAttributes(const std::string& existing)
{
    const bool filter_exists = existing.find("*.ipynb filter") != std::string::npos;
    const bool zeppelin_filter_exists = existing.find("*.zpln filter") != std::string::npos;
    const bool diff_exists = existing.find("*.ipynb diff") != std::string::npos;

    if (filter_exists && diff_exists)
        return std::string();

    std::string appended;
    if (!existing.empty() && existing.back() != '\n')
        appended += '\n';
    if (!filter_exists)
        appended += std::string(kIpynbFilterLine) + "\n";
    if (!zeppelin_filter_exists)
        appended += std::string(kZeppelinFilterLine) + "\n";
    if (!diff_exists)
        appended += std::string(kIpynbDiffLine) + "\n";
    return appended;
}

std::string removeFilterAttributes(const std::string& content)
{
    std::string kept;
    std::size_t start = 0;
    while (start < content.size())
    {
        std::size_t end = content.find('\n', start);
        end = end == std::string::npos ? content.size() : end + 1;
        const std::string line = content.substr(start, end - start);
        if (!startsWith(line, "*.ipynb filter") && !startsWith(line, "*.zpln filter") &&
            !startsWith(line, "*.ipynb diff"))
        {
            kept += line;
        }
        start = end;
    }
    return kept;
}

fs::path expandUser(const std::string& path)
{
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/' && path[1] != '\\'))
        return fs::path(path);

#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home)
        return fs::path(path);
    if (path.size() <= 2)
        return fs::path(home);
    return fs::path(home) / path.substr(2);
}

Installer::Installer(ConfigScope scope, std::ostream& out)
    : config_(scope)
    , out_(out)
{
}

std::string Installer::filterCommand()
{
    return filterCommand(utils::ProcessUtils::GetExecutablePath());
}

std::string Installer::filterCommand(const fs::path& executable)
{
    if (executable.empty())
        return {};
    return "\"" + executable.generic_string() + "\"";
}

std::optional<fs::path> Installer::systemConfigDirectory() const
{
    auto listing = utils::ProcessUtils::Run(config_.command({ "--list", "--show-origin" }), true);
    if (!listing.launched)
        return std::nullopt;

    std::string output = trim(listing.output);
    if (listing.exit_code == 0 && output.empty())
    {
        // An empty file lists nothing, so set a key briefly to learn its origin
        (void)config_.set("filter.nbstripoutput.test", "test");
        listing = utils::ProcessUtils::Run(config_.command({ "--list", "--show-origin" }));
        (void)config_.unset("filter.nbstripoutput.test");
        output = trim(listing.output);
    }

    std::string file;
    if (listing.exit_code == 0)
    {
        const std::string first_line = output.substr(0, output.find('\n'));
        file = first_line.substr(0, first_line.find('\t'));
        if (startsWith(file, "file:"))
            file = file.substr(5);
    }
    else
    {
        static const std::regex missing_file(R"(fatal:.*file '([^']+)'.*)");
        std::smatch match;
        if (!std::regex_search(output, match, missing_file))
            return std::nullopt;
        file = match[1].str();
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(file), ec);
    return (ec ? fs::path(file) : absolute).parent_path();
}

Installer::AttributesLocation Installer::resolveAttributesFile(const std::optional<std::string>& attrfile) const
{
    AttributesLocation location;
    std::string path;

    if (attrfile && !attrfile->empty())
    {
        path = *attrfile;
    }
    else if (config_.scope() == ConfigScope::Local)
    {
        auto git_dir = utils::ProcessUtils::Run({ "git", "rev-parse", "--git-dir" });
        if (!git_dir.launched)
        {
            location.failure = Failure::GitMissing;
            return location;
        }
        if (git_dir.exit_code != 0)
        {
            location.failure = Failure::CommandFailed;
            return location;
        }
        path = (fs::path(trim(git_dir.output)) / "info" / "attributes").string();
    }
    else
    {
        auto configured = config_.get("core.attributesFile");
        if (!configured.launched)
        {
            location.failure = Failure::GitMissing;
            return location;
        }
        if (configured.exit_code == 0)
        {
            path = trim(configured.output);
        }
        else if (config_.scope() == ConfigScope::System)
        {
            auto dir = systemConfigDirectory();
            if (!dir)
            {
                location.failure = Failure::CommandFailed;
                return location;
            }
            path = (*dir / "gitattributes").string();
        }
        else
        {
            const char* xdg = std::getenv("XDG_CONFIG_HOME");
            fs::path config_dir = xdg && *xdg ? fs::path(xdg) : expandUser("~/.config");
            path = (config_dir / "git" / "attributes").string();
        }
    }

    location.path = expandUser(path);
    if (location.path.has_parent_path())
    {
        std::error_code ec;
        fs::create_directories(location.path.parent_path(), ec);
        if (ec)
            PLOG_DEBUG << "Could not create " << location.path.parent_path().string() << ": " << ec.message();
    }
    return location;
}

int Installer::install(const std::optional<std::string>& attrfile)
{
    const std::string filepath = filterCommand();
    if (filepath.empty())
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Installation failed: cannot locate the nbstripout executable");
        return 1;
    }

    const std::vector<std::pair<std::string, std::string>> entries = {
        { "filter.nbstripout.clean", filepath },
        { "filter.nbstripout.smudge", "cat" },
        { "diff.ipynb.textconv", filepath + " -t" },
    };

    for (const auto& [key, value] : entries)
    {
        auto result = config_.set(key, value);
        if (!result.launched)
        {
            ErrorReporter::ReportError(ErrorCategory::Git, "Installation failed: git is not on path!");
            return 1;
        }
        if (result.exit_code != 0)
        {
            ErrorReporter::ReportError(ErrorCategory::Git, "Installation failed: not a git repository!",
                                       "git config " + key + " exited with " + std::to_string(result.exit_code));
            return 1;
        }
    }

    auto location = resolveAttributesFile(attrfile);
    if (location.failure == Failure::GitMissing)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Installation failed: git is not on path!");
        return 1;
    }
    if (location.failure == Failure::CommandFailed)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Installation failed: not a git repository!");
        return 1;
    }

    std::string existing;
    std::error_code ec;
    if (fs::exists(location.path, ec))
        (void)readFile(location.path, existing);

    const std::string appended = missingAttributes(existing);
    if (appended.empty())
    {
        PLOG_DEBUG << "Attributes already present in " << location.path.string();
        return 0;
    }

    std::ofstream file(location.path, std::ios::binary | std::ios::app);
    if (file.is_open())
        file << appended;
    if (!file.is_open() || !file)
    {
        ErrorReporter::ReportError(ErrorCategory::Git,
                                   "Installation failed: could not write to " + location.path.string());
        if (config_.scope() == ConfigScope::Global)
            ErrorReporter::ReportError(ErrorCategory::Git, "Did you forget to sudo?");
        return 1;
    }

    PLOG_INFO << "Installed nbstripout filter, attributes in " << location.path.string();
    return 0;
}

int Installer::uninstall(const std::optional<std::string>& attrfile)
{
    auto clean = config_.unset("filter.nbstripout.clean");
    if (!clean.launched)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Uninstall failed: git is not on path!");
        return 1;
    }
    (void)config_.unset("filter.nbstripout.smudge");
    (void)config_.removeSection("diff.ipynb");

    auto location = resolveAttributesFile(attrfile);
    if (location.failure == Failure::GitMissing)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Uninstall failed: git is not on path!");
        return 1;
    }
    if (location.failure == Failure::CommandFailed)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Uninstall failed: not a git repository!");
        return 1;
    }

    std::error_code ec;
    if (!fs::exists(location.path, ec))
        return 0;

    std::string content;
    if (!readFile(location.path, content))
    {
        ErrorReporter::ReportError(ErrorCategory::Git,
                                   "Uninstall failed: could not read " + location.path.string());
        return 1;
    }

    std::ofstream file(location.path, std::ios::binary | std::ios::trunc);
    if (file.is_open())
        file << removeFilterAttributes(content);
    if (!file.is_open() || !file)
    {
        ErrorReporter::ReportError(ErrorCategory::Git,
                                   "Uninstall failed: could not write to " + location.path.string());
        return 1;
    }
    return 0;
}

int Installer::status(bool verbose)
{
    std::string location;
    switch (config_.scope())
    {
    case ConfigScope::System:
        location = "system-wide";
        break;
    case ConfigScope::Global:
        location = "globally";
        break;
    case ConfigScope::Local:
    {
        auto git_dir = utils::ProcessUtils::Run({ "git", "rev-parse", "--git-dir" });
        if (!git_dir.launched)
        {
            ErrorReporter::ReportError(ErrorCategory::Git, "Cannot determine status: git is not on path!");
            return 1;
        }
        if (git_dir.exit_code != 0)
            return 1;
        std::error_code ec;
        fs::path dir = fs::absolute(fs::path(trim(git_dir.output)), ec);
        location = "in repository '" + dir.parent_path().string() + "'";
        break;
    }
    }

    auto notInstalled = [&]()
    {
        if (verbose)
            out_ << "nbstripout is not installed " << location << "\n";
        return 1;
    };

    auto clean = config_.get("filter.nbstripout.clean");
    if (!clean.launched)
    {
        ErrorReporter::ReportError(ErrorCategory::Git, "Cannot determine status: git is not on path!");
        return 1;
    }
    auto smudge = config_.get("filter.nbstripout.smudge");
    auto diff = config_.get("diff.ipynb.textconv");
    if (!clean.succeeded() || !smudge.succeeded() || !diff.succeeded())
        return notInstalled();

    std::string attributes;
    std::string diff_attributes;
    if (config_.scope() == ConfigScope::Local)
    {
        auto filter_attr = utils::ProcessUtils::Run({ "git", "check-attr", "filter", "--", "*.ipynb" });
        auto diff_attr = utils::ProcessUtils::Run({ "git", "check-attr", "diff", "--", "*.ipynb" });
        if (!filter_attr.succeeded() || !diff_attr.succeeded())
            return notInstalled();
        attributes = trim(filter_attr.output);
        diff_attributes = trim(diff_attr.output);
    }
    else
    {
        auto attrs = resolveAttributesFile(std::nullopt);
        if (attrs.failure != Failure::None)
            return notInstalled();
        std::string content;
        std::error_code ec;
        if (fs::exists(attrs.path, ec) && readFile(attrs.path, content))
        {
            attributes = linesContaining(content, "filter");
            diff_attributes = linesContaining(content, "diff");
        }
    }

    auto extra = config_.get("filter.nbstripout.extrakeys");
    const std::string extra_keys = extra.succeeded() ? trim(extra.output) : std::string();

    if (endsWith(attributes, "unspecified"))
        return notInstalled();

    if (verbose)
    {
        out_ << "nbstripout is installed " << location << "\n";
        out_ << "\nFilter:\n";
        out_ << "  clean = " << trim(clean.output) << "\n";
        out_ << "  smudge = " << trim(smudge.output) << "\n";
        out_ << "  diff= " << trim(diff.output) << "\n";
        out_ << "  extrakeys= " << extra_keys << "\n";
        out_ << "\nAttributes:\n  " << attributes << "\n";
        out_ << "\nDiff Attributes:\n  " << diff_attributes << "\n";
    }
    return 0;
}

} // namespace git
