#pragma once

#include "../platform/ProcessUtils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace git
{

enum class ConfigScope
{
    Local,
    Global,
    System
};

// Thin wrapper over `git config` for one scope.
class GitConfig
{
public:
    explicit GitConfig(ConfigScope scope = ConfigScope::Local);

    ConfigScope scope() const { return scope_; }

    // "git config --local|--global|--system" followed by args
    std::vector<std::string> command(const std::vector<std::string>& args) const;

    utils::CommandResult get(const std::string& key) const;
    utils::CommandResult set(const std::string& key, const std::string& value) const;
    utils::CommandResult unset(const std::string& key) const;
    utils::CommandResult removeSection(const std::string& section) const;

    // Whitespace separated extra keys from filter.nbstripout.extrakeys.
    // The local scope reads with git's normal lookup order, the other
    // scopes read their own file only. Missing git or key yields nothing.
    std::vector<std::string> readExtraKeys() const;

    static std::string scopeFlag(ConfigScope scope);

private:
    ConfigScope scope_;
};

} // namespace git
