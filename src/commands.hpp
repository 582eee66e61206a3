#pragma once
#include <istream>
#include <string>
#include <vector>

namespace hookchain {

// Exit code for configuration problems, distinct from chain outcomes (0/1/124).
constexpr int kConfigErrorExitCode = 2;

struct RunOptions {
    std::string chain;
    std::string config_path;             // empty = default_config_path()
    std::string input;                   // literal, "@file", "-" for stdin; empty = "{}"
    std::vector<std::string> hooks_dirs; // searched before the configured ones
    bool verbose = false;
};

struct Config;

// Loads `path_arg` (or the default path); prints the error and returns false on ConfigError.
bool load_config(const std::string& path_arg, Config& out);

// Resolves the run input: empty = "{}", "-" = all of `in`, "@file" = file contents,
// anything else is taken literally.
bool read_input(const std::string& arg, std::string& out, std::istream& in);

int cmd_run(const RunOptions& opts);
int cmd_list(const std::string& config_path);
int cmd_validate(const std::string& config_path, bool dump);

} // namespace hookchain
