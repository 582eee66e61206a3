#include "commands.hpp"
#include "config.hpp"
#include "hook_invoker.hpp"
#include "hook_resolver.hpp"
#include "orchestrator.hpp"
#include "reporter.hpp"
#include "utils.hpp"
#include <iostream>
#include <memory>

namespace hookchain {

bool load_config(const std::string& path_arg, Config& out) {
    std::string path = path_arg.empty() ? default_config_path() : expand_path(path_arg);
    try {
        out = Config::load(path);
        return true;
    } catch (const ConfigError& e) {
        std::cerr << "[config] Error: " << e.what() << "\n";
        return false;
    }
}

bool read_input(const std::string& arg, std::string& out, std::istream& in) {
    if (arg.empty()) {
        out = "{}";
        return true;
    }
    if (arg == "-") {
        out = read_stream(in);
        return true;
    }
    if (arg[0] == '@') {
        if (!read_file(expand_path(arg.substr(1)), out)) {
            std::cerr << "[run] Cannot read input file " << arg.substr(1) << "\n";
            return false;
        }
        return true;
    }
    out = arg;
    return true;
}

int cmd_run(const RunOptions& opts) {
    Config cfg;
    if (!load_config(opts.config_path, cfg)) return kConfigErrorExitCode;

    std::string input;
    if (!read_input(opts.input, input, std::cin)) return kConfigErrorExitCode;

    // The payload is opaque, but a malformed JSON literal is usually a typo
    std::string t = trim(input);
    if (!t.empty() && (t[0] == '{' || t[0] == '[') && !nlohmann::json::accept(t)) {
        std::cerr << "[run] Warning: input looks like JSON but does not parse; passing it through as-is\n";
    }

    std::vector<std::string> dirs = opts.hooks_dirs;
    for (auto& d : dirs) d = expand_path(d);
    for (auto& d : cfg.expanded_hooks_dirs()) dirs.push_back(d);
    DirectoryHookResolver resolver(dirs);

    ProcessHookInvoker invoker(cfg.max_output_bytes);

    MultiReporter reporter;
    reporter.add(std::make_shared<StderrReporter>(opts.verbose));
    if (!cfg.log_file.empty()) {
        auto file_sink = std::make_shared<JsonLinesReporter>(cfg.log_path());
        if (file_sink->is_open()) reporter.add(file_sink);
    }

    ChainOrchestrator orchestrator(cfg, resolver, invoker, reporter);
    ChainRunResult res = orchestrator.run(opts.chain, input);

    std::cout << res.final_output;
    if (!res.final_output.empty() && res.final_output.back() != '\n') std::cout << "\n";
    std::cout.flush();

    std::cerr << "[run] " << res.chain_name << ": " << chain_status_name(res.status)
              << " (" << res.steps_executed << " executed, " << res.steps_failed << " failed, "
              << res.duration.count() << "ms)";
    if (!res.aborted_at.empty()) {
        std::cerr << ", aborted at " << res.aborted_at << " (" << outcome_name(res.abort_outcome) << ")";
    }
    std::cerr << "\n";

    return res.exit_code();
}

int cmd_list(const std::string& config_path) {
    Config cfg;
    if (!load_config(config_path, cfg)) return kConfigErrorExitCode;

    if (cfg.chains.empty()) {
        std::cout << "No chains configured.\n";
        return 0;
    }

    for (auto& [name, chain] : cfg.chains) {
        std::cout << name << (chain.enabled ? "" : " (disabled)") << "\n";
        if (!chain.description.empty()) {
            std::cout << "  " << chain.description << "\n";
        }
        std::cout << "  propagate output : " << (chain.propagate_output ? "yes" : "no") << "\n";
        std::cout << "  stop on failure  : " << (chain.stop_on_failure ? "yes" : "no") << "\n";
        std::cout << "  sequence         :\n";
        int i = 1;
        for (auto& hook : chain.sequence) {
            HookMetadata m = cfg.metadata_for(hook);
            std::cout << "    " << i++ << ". " << hook
                      << " (timeout " << m.timeout_seconds << "s"
                      << ", attempts " << m.max_attempts()
                      << (m.critical ? ", critical" : "") << ")\n";
        }
    }
    return 0;
}

int cmd_validate(const std::string& config_path, bool dump) {
    Config cfg;
    if (!load_config(config_path, cfg)) return kConfigErrorExitCode;

    if (dump) {
        std::cout << cfg.to_json().dump(2) << std::endl;
    }

    DirectoryHookResolver resolver(cfg.expanded_hooks_dirs());
    int missing = 0;
    for (auto& [name, chain] : cfg.chains) {
        if (!chain.enabled) continue;
        for (auto& hook : chain.sequence) {
            auto cmd = resolver.resolve(hook);
            if (!cmd) {
                std::cerr << "[validate] " << name << ": hook '" << hook << "' not found\n";
                missing++;
            }
        }
    }

    for (auto& [hook, _] : cfg.hook_metadata) {
        bool used = false;
        for (auto& [name, chain] : cfg.chains) {
            for (auto& h : chain.sequence) used = used || h == hook;
        }
        if (!used) {
            std::cerr << "[validate] Warning: metadata for '" << hook << "' is not used by any chain\n";
        }
    }

    if (missing > 0) {
        std::cerr << "[validate] " << missing << " hook(s) could not be resolved\n";
        return 1;
    }
    std::cerr << "[validate] OK: " << cfg.chains.size() << " chain(s)\n";
    return 0;
}

} // namespace hookchain
