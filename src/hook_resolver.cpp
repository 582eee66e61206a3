#include "hook_resolver.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <unistd.h>

namespace hookchain {

HookCommand command_for_file(const std::string& path) {
    if (fs::path(path).extension() == ".sh") {
        return HookCommand{"bash", {path}};
    }
    return HookCommand{path, {}};
}

DirectoryHookResolver::DirectoryHookResolver(std::vector<std::string> roots)
    : roots_(std::move(roots)) {}

static bool is_candidate(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
    if (p.extension() == ".sh") return true;
    return access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> DirectoryHookResolver::find_file(const std::string& root,
                                                            const std::string& hook_name) const {
    std::error_code ec;
    fs::path base(root);
    if (!fs::is_directory(base, ec)) return std::nullopt;

    // Direct hits first
    for (auto& candidate : {base / hook_name, base / (hook_name + ".sh")}) {
        if (is_candidate(candidate)) return candidate.string();
    }

    // A name with a directory part is only ever looked up directly
    if (hook_name.find('/') != std::string::npos) return std::nullopt;

    // Recursive scan; collect and sort so the result doesn't depend on readdir order
    std::vector<fs::path> hits;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[resolver] Cannot scan " << root << ": " << ec.message() << "\n";
        return std::nullopt;
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[resolver] Error scanning " << root << ": " << ec.message() << "\n";
            break;
        }
        const auto& p = it->path();
        auto fname = p.filename().string();
        if (fname != hook_name && fname != hook_name + ".sh") continue;
        if (is_candidate(p)) hits.push_back(p);
    }
    if (hits.empty()) return std::nullopt;
    std::sort(hits.begin(), hits.end());
    return hits.front().string();
}

std::optional<HookCommand> DirectoryHookResolver::resolve(const std::string& hook_name) const {
    if (hook_name.empty() || hook_name.find("..") != std::string::npos || hook_name[0] == '/') {
        std::cerr << "[resolver] Rejected hook name: '" << hook_name << "'\n";
        return std::nullopt;
    }

    for (auto& root : roots_) {
        if (auto path = find_file(root, hook_name)) {
            return command_for_file(*path);
        }
    }
    return std::nullopt;
}

} // namespace hookchain
