#include "GitConfig.hpp"
#include "../utils/TextUtils.hpp"

#include <plog/Log.h>

namespace git
{

GitConfig::GitConfig(ConfigScope scope)
    : scope_(scope)
{
}

std::string GitConfig::scopeFlag(ConfigScope scope)
{
    switch (scope)
    {
    case ConfigScope::Global:
        return "--global";
    case ConfigScope::System:
        return "--system";
    case ConfigScope::Local:
    default:
        return "--local";
    }
}

std::vector<std::string> GitConfig::command(const std::vector<std::string>& args) const
{
    std::vector<std::string> cmd = { "git", "config", scopeFlag(scope_) };
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

utils::CommandResult GitConfig::get(const std::string& key) const
{
    return utils::ProcessUtils::Run(command({ key }));
}

utils::CommandResult GitConfig::set(const std::string& key, const std::string& value) const
{
    return utils::ProcessUtils::Run(command({ key, value }));
}

utils::CommandResult GitConfig::unset(const std::string& key) const
{
    return utils::ProcessUtils::Run(command({ "--unset", key }), true);
}

utils::CommandResult GitConfig::removeSection(const std::string& section) const
{
    return utils::ProcessUtils::Run(command({ "--remove-section", section }), true);
}

std::vector<std::string> GitConfig::readExtraKeys() const
{
    std::vector<std::string> cmd = { "git", "config" };
    if (scope_ != ConfigScope::Local)
        cmd.push_back(scopeFlag(scope_));
    cmd.push_back("filter.nbstripout.extrakeys");

    auto result = utils::ProcessUtils::Run(cmd);
    if (!result.succeeded())
    {
        PLOG_DEBUG << "No filter.nbstripout.extrakeys in git config";
        return {};
    }
    return utils::splitWhitespace(result.output);
}

} // namespace git
