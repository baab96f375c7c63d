#include "CommandLine.hpp"
#include "../utils/TextUtils.hpp"

#include <ostream>

namespace cli
{

namespace
{

const char* taskFlag(Task task)
{
    switch (task)
    {
    case Task::DryRun:
        return "--dry-run";
    case Task::Install:
        return "--install";
    case Task::Uninstall:
        return "--uninstall";
    case Task::IsInstalled:
        return "--is-installed";
    case Task::Status:
        return "--status";
    case Task::Version:
        return "--version";
    default:
        return "";
    }
}

// Options that take a value, in both "--opt value" and "--opt=value" form
bool takesValue(const std::string& name)
{
    return name == "--extra-keys" || name == "--drop-tagged-cells" || name == "--attributes" ||
           name == "--max-size" || name == "--mode" || name == "-m";
}

// Splits short option clusters so "-ft", "-mzeppelin" and "-m=zeppelin" become
// one token per option. Long options, their separate values and everything
// after "--" pass through unchanged.
void expandShortOptions(const std::vector<std::string>& args, std::vector<std::string>& outArgs)
{
    bool only_files = false;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (only_files || arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        {
            outArgs.push_back(arg);
            if (arg == "--")
                only_files = true;
            else if (!only_files && takesValue(arg) && i + 1 < args.size())
                outArgs.push_back(args[++i]);
            continue;
        }

        for (std::size_t pos = 1; pos < arg.size(); ++pos)
        {
            const char flag = arg[pos];
            if (flag == 'f' || flag == 't' || flag == 'h')
            {
                outArgs.push_back(std::string("-") + flag);
            }
            else if (flag == 'm')
            {
                if (pos + 1 == arg.size())
                {
                    outArgs.push_back("-m");
                    if (i + 1 < args.size())
                        outArgs.push_back(args[++i]);
                }
                else
                {
                    std::string value = arg.substr(pos + 1);
                    if (value[0] == '=')
                        value.erase(0, 1);
                    outArgs.push_back("--mode=" + value);
                }
                break;
            }
            else
            {
                // left whole so the parse loop reports it in order
                outArgs.push_back(arg);
                break;
            }
        }
    }
}

} // namespace

bool parseCommandLine(const std::vector<std::string>& rawArgs, CommandLineOptions& outOptions, std::string& outError)
{
    CommandLineOptions options;
    std::optional<std::string> location_flag;
    bool only_files = false;

    auto selectTask = [&](Task task, const std::string& flag) -> bool
    {
        if (options.task != Task::Strip && options.task != task)
        {
            outError = "argument " + flag + ": not allowed with argument " + taskFlag(options.task);
            return false;
        }
        options.task = task;
        return true;
    };

    auto selectScope = [&](git::ConfigScope scope, const std::string& flag) -> bool
    {
        if (location_flag && *location_flag != flag)
        {
            outError = "argument " + flag + ": not allowed with argument " + *location_flag;
            return false;
        }
        location_flag = flag;
        options.scope = scope;
        return true;
    };

    std::vector<std::string> expanded;
    expandShortOptions(rawArgs, expanded);
    const std::vector<std::string>& args = expanded;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (only_files || arg.empty() || arg[0] != '-' || arg == "-")
        {
            options.files.push_back(arg);
            continue;
        }
        if (arg == "--")
        {
            only_files = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> value;
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
        {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (takesValue(name))
        {
            if (!value)
            {
                if (i + 1 >= args.size())
                {
                    outError = "argument " + name + ": expected one argument";
                    return false;
                }
                value = args[++i];
            }
        }
        else if (value)
        {
            outError = "argument " + name + ": ignored explicit argument '" + *value + "'";
            return false;
        }

        if (name == "-h" || name == "--help")
        {
            options.task = Task::Help;
            outOptions = std::move(options);
            return true;
        }
        else if (name == "--dry-run")
        {
            if (!selectTask(Task::DryRun, name))
                return false;
        }
        else if (name == "--install")
        {
            if (!selectTask(Task::Install, name))
                return false;
        }
        else if (name == "--uninstall")
        {
            if (!selectTask(Task::Uninstall, name))
                return false;
        }
        else if (name == "--is-installed")
        {
            if (!selectTask(Task::IsInstalled, name))
                return false;
        }
        else if (name == "--status")
        {
            if (!selectTask(Task::Status, name))
                return false;
        }
        else if (name == "--version")
        {
            if (!selectTask(Task::Version, name))
                return false;
        }
        else if (name == "--keep-count")
        {
            options.overrides.keep_count = true;
        }
        else if (name == "--keep-output")
        {
            options.overrides.keep_output = true;
        }
        else if (name == "--extra-keys")
        {
            for (auto& key : utils::splitWhitespace(*value))
                options.overrides.extra_keys.push_back(std::move(key));
        }
        else if (name == "--drop-empty-cells")
        {
            options.overrides.drop_empty_cells = true;
        }
        else if (name == "--drop-tagged-cells")
        {
            options.overrides.drop_tagged_cells = utils::splitWhitespace(*value);
        }
        else if (name == "--strip-init-cells")
        {
            options.overrides.strip_init_cells = true;
        }
        else if (name == "--attributes")
        {
            options.attributes = *value;
        }
        else if (name == "--global")
        {
            if (!selectScope(git::ConfigScope::Global, name))
                return false;
        }
        else if (name == "--system")
        {
            if (!selectScope(git::ConfigScope::System, name))
                return false;
        }
        else if (name == "-f" || name == "--force")
        {
            options.force = true;
        }
        else if (name == "--max-size")
        {
            std::uint64_t size = 0;
            std::string size_error;
            if (!config::parseSize(*value, size, size_error))
            {
                outError = "argument --max-size: " + size_error;
                return false;
            }
            options.overrides.max_size = size;
        }
        else if (name == "-m" || name == "--mode")
        {
            config::NotebookMode mode = config::NotebookMode::Jupyter;
            std::string mode_error;
            if (!config::parseMode(*value, mode, mode_error))
            {
                outError = "argument --mode/-m: " + mode_error;
                return false;
            }
            options.overrides.mode = mode;
        }
        else if (name == "-t" || name == "--textconv")
        {
            options.textconv = true;
        }
        else if (name == "--verbose")
        {
            options.verbose = true;
        }
        else
        {
            outError = "unrecognized arguments: " + arg;
            return false;
        }
    }

    outOptions = std::move(options);
    return true;
}

void printUsage(std::ostream& out, const std::string& program_name)
{
    out << "usage: " << program_name
        << " [-h] [--dry-run | --install | --uninstall | --is-installed | --status | --version]\n"
        << "       [--keep-count] [--keep-output] [--extra-keys EXTRA_KEYS] [--drop-empty-cells]\n"
        << "       [--drop-tagged-cells DROP_TAGGED_CELLS] [--strip-init-cells] [--attributes FILEPATH]\n"
        << "       [--global | --system] [--force] [--max-size SIZE] [--mode {jupyter,zeppelin}]\n"
        << "       [--textconv] [--verbose] [files ...]\n";
}

void printHelp(std::ostream& out, const std::string& program_name)
{
    printUsage(out, program_name);
    out << "\nStrip output, execution counts and volatile metadata from notebooks.\n";
    out << "\npositional arguments:\n";
    out << "  files                 Files to strip output from (stdin/stdout when omitted)\n";
    out << "\noptions:\n";
    out << "  -h, --help            Show this help message and exit\n";
    out << "  --dry-run             Print which notebooks would have been stripped\n";
    out << "  --install             Install nbstripout in the current repository (set up the git\n";
    out << "                        filter and attributes)\n";
    out << "  --uninstall           Uninstall nbstripout from the current repository (remove the\n";
    out << "                        git filter and attributes)\n";
    out << "  --is-installed        Check if nbstripout is installed in current repository\n";
    out << "  --status              Print status of nbstripout installation in current repository\n";
    out << "                        and configuration summary if installed\n";
    out << "  --version             Print version\n";
    out << "  --keep-count          Do not strip the execution count/prompt number\n";
    out << "  --keep-output         Do not strip output\n";
    out << "  --extra-keys EXTRA_KEYS\n";
    out << "                        Space separated list of extra keys to strip from metadata,\n";
    out << "                        e.g. metadata.foo cell.metadata.bar\n";
    out << "  --drop-empty-cells    Remove cells where `source` is empty or contains only whitespace\n";
    out << "  --drop-tagged-cells DROP_TAGGED_CELLS\n";
    out << "                        Space separated list of cell-tags that remove an entire cell\n";
    out << "  --strip-init-cells    Remove cells with `init_cell: true` metadata\n";
    out << "  --attributes FILEPATH Attributes file to add the filter to (in combination with\n";
    out << "                        --install/--uninstall), defaults to .git/info/attributes\n";
    out << "  --global              Use global git config (default is local config)\n";
    out << "  --system              Use system git config (default is local config)\n";
    out << "  -f, --force           Strip output also from files with non ipynb extension\n";
    out << "  --max-size SIZE       Keep outputs smaller than SIZE (e.g. 500, 10k, 1M)\n";
    out << "  -m, --mode {jupyter,zeppelin}\n";
    out << "                        Notebook format, jupyter by default (use with -f)\n";
    out << "  -t, --textconv        Prints stripped files to STDOUT\n";
    out << "  --verbose             Log debug information on stderr\n";
    out << "\nSettings are also read from git config (filter.nbstripout.extrakeys) and from the\n";
    out << "[tool.nbstripout] table of the nearest pyproject.toml.\n";
}

} // namespace cli
