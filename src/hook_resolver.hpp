#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include "types.hpp"

namespace hookchain {

// Maps a hook name to the command that runs it. Synchronous; must return
// before the hook is invoked. std::nullopt means "hook not found".
class HookResolver {
public:
    virtual ~HookResolver() = default;
    virtual std::optional<HookCommand> resolve(const std::string& hook_name) const = 0;
};

// Searches hook root directories laid out as <root>/<category>/.../<name>.sh.
// For each root, in order: <root>/<name>, <root>/<name>.sh, then a recursive
// scan for a file named <name> or <name>.sh. First hit wins.
class DirectoryHookResolver : public HookResolver {
public:
    explicit DirectoryHookResolver(std::vector<std::string> roots);

    std::optional<HookCommand> resolve(const std::string& hook_name) const override;

    const std::vector<std::string>& roots() const { return roots_; }

private:
    std::vector<std::string> roots_;

    std::optional<std::string> find_file(const std::string& root, const std::string& hook_name) const;
};

// Fixed name -> command table. Used for chains whose hooks are not on disk.
class StaticHookResolver : public HookResolver {
public:
    void add(const std::string& hook_name, HookCommand cmd) {
        commands_[hook_name] = std::move(cmd);
    }

    std::optional<HookCommand> resolve(const std::string& hook_name) const override {
        auto it = commands_.find(hook_name);
        if (it == commands_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, HookCommand> commands_;
};

// Turns a located hook file into a command: *.sh runs through bash,
// anything else is executed directly.
HookCommand command_for_file(const std::string& path);

} // namespace hookchain
