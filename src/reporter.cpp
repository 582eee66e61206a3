#include "reporter.hpp"
#include "utils.hpp"

namespace hookchain {

const char* event_kind_name(EventKind k) {
    switch (k) {
    case EventKind::chain_start:       return "chain_start";
    case EventKind::chain_skipped:     return "chain_skipped";
    case EventKind::attempt:           return "attempt";
    case EventKind::attempt_failed:    return "attempt_failed";
    case EventKind::step_success:      return "step_success";
    case EventKind::step_timeout:      return "step_timeout";
    case EventKind::step_failure:      return "step_failure";
    case EventKind::output_propagated: return "output_propagated";
    case EventKind::chain_complete:    return "chain_complete";
    }
    return "unknown";
}

nlohmann::json event_to_json(const ChainEvent& e) {
    nlohmann::json j = {
        {"event", event_kind_name(e.kind)},
        {"chain", e.chain},
        {"elapsed_ms", e.elapsed.count()}
    };
    if (!e.hook.empty()) j["hook"] = e.hook;
    if (e.attempt > 0) {
        j["attempt"] = e.attempt;
        j["max_attempts"] = e.max_attempts;
    }
    if (e.outcome) {
        j["outcome"] = outcome_name(*e.outcome);
        j["exit_code"] = e.exit_code;
    }
    if (!e.message.empty()) j["message"] = e.message;
    return j;
}

void StderrReporter::report(const ChainEvent& e) {
    bool always = e.kind == EventKind::step_success || e.kind == EventKind::step_timeout ||
                  e.kind == EventKind::step_failure || e.kind == EventKind::chain_complete ||
                  e.kind == EventKind::chain_skipped;
    if (!verbose_ && !always) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[chain:" << e.chain << "] ";
    switch (e.kind) {
    case EventKind::chain_start:
        out_ << "Starting";
        break;
    case EventKind::chain_skipped:
        out_ << "Skipped";
        break;
    case EventKind::attempt:
        out_ << e.hook << " attempt " << e.attempt << "/" << e.max_attempts;
        break;
    case EventKind::attempt_failed:
        out_ << e.hook << " attempt " << e.attempt << "/" << e.max_attempts << " "
             << (e.outcome ? outcome_name(*e.outcome) : "failed")
             << " (exit " << e.exit_code << "), retrying";
        break;
    case EventKind::step_success:
        out_ << e.hook << " ok";
        break;
    case EventKind::step_timeout:
        out_ << e.hook << " TIMED OUT after " << e.attempt << " attempt(s)";
        break;
    case EventKind::step_failure:
        out_ << e.hook << " FAILED (exit " << e.exit_code << ") after "
             << e.attempt << " attempt(s)";
        break;
    case EventKind::output_propagated:
        out_ << e.hook << " output passed to next step";
        break;
    case EventKind::chain_complete:
        out_ << "Finished";
        break;
    }
    if (!e.message.empty()) out_ << ": " << e.message;
    out_ << " [" << e.elapsed.count() << "ms]\n";
}

JsonLinesReporter::JsonLinesReporter(const std::string& path) : path_(path) {
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    out_.open(path, std::ios::app);
    if (!out_) {
        std::cerr << "[reporter] Cannot open log file " << path << ", execution log disabled\n";
    }
}

void JsonLinesReporter::report(const ChainEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) return;
    auto j = event_to_json(event);
    j["ts"] = timestamp_str();
    out_ << j.dump() << "\n";
    out_.flush();
}

} // namespace hookchain
