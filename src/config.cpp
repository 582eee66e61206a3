#include "config.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>

namespace hookchain {

HookMetadata Config::metadata_for(const std::string& hook) const {
    auto it = hook_metadata.find(hook);
    if (it != hook_metadata.end()) return it->second;
    return HookMetadata{};
}

std::optional<ChainDefinition> Config::find_chain(const std::string& name) const {
    auto it = chains.find(name);
    if (it == chains.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Config::expanded_hooks_dirs() const {
    std::vector<std::string> dirs;
    for (auto& d : hooks_dirs) dirs.push_back(expand_path(d));
    if (dirs.empty()) dirs.push_back(default_hooks_dir());
    return dirs;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["hooks_dirs"] = hooks_dirs;
    j["log_file"] = log_file;
    j["max_output_bytes"] = max_output_bytes;

    j["chains"] = nlohmann::json::object();
    for (auto& [name, c] : chains) {
        nlohmann::json cj;
        if (!c.description.empty()) cj["description"] = c.description;
        cj["sequence"] = c.sequence;
        cj["pass_output_to_next"] = c.propagate_output;
        cj["stop_on_failure"] = c.stop_on_failure;
        cj["enabled"] = c.enabled;
        j["chains"][name] = cj;
    }

    j["hook_metadata"] = nlohmann::json::object();
    for (auto& [name, m] : hook_metadata) {
        j["hook_metadata"][name] = {
            {"timeout_seconds", m.timeout_seconds},
            {"retry_count", m.retry_count},
            {"critical", m.critical}
        };
    }

    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr, const std::string& where) {
    if (!arr.is_array()) {
        throw ConfigError(where + ": expected an array of strings");
    }
    std::vector<std::string> result;
    for (auto& item : arr) {
        if (!item.is_string()) {
            throw ConfigError(where + ": expected an array of strings, found " + item.dump());
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

static bool read_bool(const nlohmann::json& obj, const char* key, bool def, const std::string& where) {
    if (!obj.contains(key)) return def;
    const auto& v = obj[key];
    if (!v.is_boolean()) {
        throw ConfigError(where + "." + key + ": expected a boolean, found " + v.dump());
    }
    return v.get<bool>();
}

static int read_int(const nlohmann::json& obj, const char* key, int def, const std::string& where) {
    if (!obj.contains(key)) return def;
    const auto& v = obj[key];
    if (!v.is_number_integer()) {
        throw ConfigError(where + "." + key + ": expected an integer, found " + v.dump());
    }
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError(where + "." + key + ": out of range: " + v.dump());
        }
    } else {
        int64_t n = v.get<int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw ConfigError(where + "." + key + ": out of range: " + v.dump());
        }
    }
    return v.get<int>();
}

static ChainDefinition parse_chain(const std::string& name, const nlohmann::json& cj) {
    std::string where = "chains." + name;
    if (!cj.is_object()) {
        throw ConfigError(where + ": expected an object");
    }

    ChainDefinition c;
    c.name = name;
    if (cj.contains("description")) {
        if (!cj["description"].is_string()) {
            throw ConfigError(where + ".description: expected a string");
        }
        c.description = cj["description"].get<std::string>();
    }

    if (!cj.contains("sequence")) {
        throw ConfigError(where + ": missing 'sequence'");
    }
    c.sequence = parse_string_array(cj["sequence"], where + ".sequence");
    if (c.sequence.empty()) {
        throw ConfigError(where + ".sequence: must list at least one hook");
    }
    for (auto& h : c.sequence) {
        if (h.empty()) throw ConfigError(where + ".sequence: empty hook name");
    }

    // Both spellings are accepted; pass_output_to_next is the historical one
    c.propagate_output = read_bool(cj, "propagate_output", c.propagate_output, where);
    c.propagate_output = read_bool(cj, "pass_output_to_next", c.propagate_output, where);
    c.stop_on_failure = read_bool(cj, "stop_on_failure", c.stop_on_failure, where);
    c.enabled = read_bool(cj, "enabled", c.enabled, where);

    std::vector<std::string> seen;
    for (auto& h : c.sequence) {
        if (std::find(seen.begin(), seen.end(), h) != seen.end()) {
            std::cerr << "[config] Warning: chain '" << name << "' lists hook '" << h
                      << "' more than once\n";
        }
        seen.push_back(h);
    }
    return c;
}

static HookMetadata parse_metadata(const std::string& name, const nlohmann::json& mj) {
    std::string where = "hook_metadata." + name;
    if (!mj.is_object()) {
        throw ConfigError(where + ": expected an object");
    }
    HookMetadata m;
    m.timeout_seconds = read_int(mj, "timeout_seconds", m.timeout_seconds, where);
    m.retry_count = read_int(mj, "retry_count", m.retry_count, where);
    m.critical = read_bool(mj, "critical", m.critical, where);

    if (m.timeout_seconds < 1) {
        throw ConfigError(where + ".timeout_seconds: must be a positive integer");
    }
    if (m.retry_count < 0) {
        throw ConfigError(where + ".retry_count: must not be negative");
    }
    if (m.retry_count > kMaxRetryCount) {
        throw ConfigError(where + ".retry_count: must be at most " + std::to_string(kMaxRetryCount));
    }
    return m;
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    Config c;

    try {
        if (j.contains("hooks_dirs")) {
            c.hooks_dirs = parse_string_array(j["hooks_dirs"], "hooks_dirs");
        }
        c.log_file = j.value("log_file", c.log_file);
        if (j.contains("max_output_bytes")) {
            if (!j["max_output_bytes"].is_number_unsigned()) {
                throw ConfigError("max_output_bytes: expected a non-negative integer");
            }
            c.max_output_bytes = j["max_output_bytes"].get<size_t>();
        }

        if (j.contains("chains")) {
            if (!j["chains"].is_object()) throw ConfigError("chains: expected an object");
            for (auto& [name, cj] : j["chains"].items()) {
                c.chains[name] = parse_chain(name, cj);
            }
        }

        if (j.contains("hook_metadata")) {
            if (!j["hook_metadata"].is_object()) throw ConfigError("hook_metadata: expected an object");
            for (auto& [name, mj] : j["hook_metadata"].items()) {
                c.hook_metadata[name] = parse_metadata(name, mj);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }

    if (c.max_output_bytes == 0) {
        throw ConfigError("max_output_bytes: must be positive");
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("config not found at " + path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace hookchain
