#pragma once
#include <string>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iostream>

namespace hookchain {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    if (p == "~") return home_dir();
    return p;
}

// $HOOKCHAIN_CONFIG wins over ~/.hookchain/chains.json
inline std::string default_config_path() {
    const char* env = std::getenv("HOOKCHAIN_CONFIG");
    if (env && *env) return env;
    return home_dir() + "/.hookchain/chains.json";
}

inline std::string default_hooks_dir() {
    return home_dir() + "/.hookchain/hooks";
}

// Returns false if the file could not be opened; `out` is left untouched then.
inline bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

inline std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Local time, "2024-05-01 13:37:00"
inline std::string timestamp_str() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // namespace hookchain
