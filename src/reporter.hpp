#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace hookchain {

enum class EventKind {
    chain_start,
    chain_skipped,      // unknown or disabled chain, resolved as no-op success
    attempt,            // one invocation is about to start
    attempt_failed,     // non-final attempt failed; a retry follows
    step_success,
    step_timeout,
    step_failure,
    output_propagated,
    chain_complete,
};

const char* event_kind_name(EventKind k);

struct ChainEvent {
    EventKind kind = EventKind::chain_start;
    std::string chain;
    std::string hook;
    int attempt = 0;
    int max_attempts = 0;
    std::optional<Outcome> outcome;
    int exit_code = 0;
    Millis elapsed{0};
    std::string message;
};

nlohmann::json event_to_json(const ChainEvent& e);

// Receives execution telemetry. Storage is up to the implementation.
class Reporter {
public:
    virtual ~Reporter() = default;
    virtual void report(const ChainEvent& event) = 0;
};

class NullReporter : public Reporter {
public:
    void report(const ChainEvent&) override {}
};

// "[chain:<name>] ..." lines. Quiet mode prints step outcomes and completion only.
class StderrReporter : public Reporter {
public:
    explicit StderrReporter(bool verbose = false, std::ostream& out = std::cerr)
        : verbose_(verbose), out_(out) {}

    void report(const ChainEvent& event) override;

private:
    bool verbose_;
    std::ostream& out_;
    std::mutex mutex_;
};

// One JSON object per line, appended to a log file. If the file cannot be
// opened the sink logs once and drops events; telemetry never fails a chain.
class JsonLinesReporter : public Reporter {
public:
    explicit JsonLinesReporter(const std::string& path);

    void report(const ChainEvent& event) override;

    bool is_open() const { return out_.is_open(); }

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

class MultiReporter : public Reporter {
public:
    void add(std::shared_ptr<Reporter> sink) {
        if (sink) sinks_.push_back(std::move(sink));
    }

    void report(const ChainEvent& event) override {
        for (auto& s : sinks_) s->report(event);
    }

    size_t size() const { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<Reporter>> sinks_;
};

} // namespace hookchain
