#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: hookchain <command> [options]\n\n"
              << "Commands:\n"
              << "  run <chain> [--config PATH] [--input JSON|@FILE|-]\n"
              << "      [--hooks-dir DIR]... [-v]\n"
              << "                              Run a hook chain\n"
              << "  list [--config PATH]        Show configured chains\n"
              << "  validate [--config PATH] [--dump]\n"
              << "                              Check config and hook resolution\n\n"
              << "Exit codes for run: 0 completed, 1 aborted, 124 aborted on timeout,\n"
              << "2 configuration error.\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    std::string config_path;
    for (size_t i = 0; i < args.size(); i++) {
        if ((args[i] == "--config" || args[i] == "-c") && i + 1 < args.size()) {
            config_path = args[i + 1];
        }
    }

    if (cmd == "run") {
        hookchain::RunOptions opts;
        opts.config_path = config_path;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "--config" || args[i] == "-c") && i + 1 < args.size()) {
                ++i;
            } else if ((args[i] == "--input" || args[i] == "-i") && i + 1 < args.size()) {
                opts.input = args[++i];
            } else if (args[i] == "--hooks-dir" && i + 1 < args.size()) {
                opts.hooks_dirs.push_back(args[++i]);
            } else if (args[i] == "-v" || args[i] == "--verbose") {
                opts.verbose = true;
            } else if (opts.chain.empty() && !args[i].empty() && args[i][0] != '-') {
                opts.chain = args[i];
            } else {
                std::cerr << "Unknown argument: " << args[i] << "\n";
                print_usage();
                return 1;
            }
        }
        if (opts.chain.empty()) {
            std::cerr << "run: missing chain name\n";
            print_usage();
            return 1;
        }
        return hookchain::cmd_run(opts);
    }
    else if (cmd == "list") {
        return hookchain::cmd_list(config_path);
    }
    else if (cmd == "validate") {
        bool dump = false;
        for (auto& a : args) {
            if (a == "--dump") dump = true;
        }
        return hookchain::cmd_validate(config_path, dump);
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
