#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "types.hpp"
#include "utils.hpp"

namespace hookchain {

// Raised for anything that prevents a chain from being run at all:
// unreadable file, bad JSON, wrong field types, invalid values.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct Config {
    std::vector<std::string> hooks_dirs;   // searched in order
    std::string log_file = "~/.hookchain/logs/hookchain.log";
    size_t max_output_bytes = 1 << 20;

    std::map<std::string, ChainDefinition> chains;
    std::map<std::string, HookMetadata> hook_metadata;

    // Unknown hooks get the defaults (30s, no retries, non-critical)
    HookMetadata metadata_for(const std::string& hook) const;

    std::optional<ChainDefinition> find_chain(const std::string& name) const;

    std::vector<std::string> expanded_hooks_dirs() const;
    std::string log_path() const { return expand_path(log_file); }

    static Config load(const std::string& path);
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace hookchain
