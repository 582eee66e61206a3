#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <limits>

namespace hookchain {

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

// Exit status reported for a hook killed by the watchdog. Matches timeout(1).
constexpr int kTimeoutExitCode = 124;
// Exit status for "command not found", both from exec failure and resolution.
constexpr int kNotFoundExitCode = 127;

enum class Outcome {
    success,
    timed_out,
    failed,
};

const char* outcome_name(Outcome o);

// Upper bound accepted from config for HookMetadata::retry_count.
constexpr int kMaxRetryCount = 1000;

struct HookMetadata {
    int timeout_seconds = 30;
    int retry_count = 0;       // 0 = exactly one attempt
    bool critical = false;     // failure aborts the chain even without stop_on_failure

    int max_attempts() const {
        if (retry_count < 0) return 1;
        if (retry_count == std::numeric_limits<int>::max()) return retry_count;
        return retry_count + 1;
    }
};

struct ChainDefinition {
    std::string name;
    std::string description;
    std::vector<std::string> sequence;
    bool propagate_output = false;
    bool stop_on_failure = false;
    bool enabled = true;
};

// What to exec for a hook: program looked up via PATH, plus arguments.
struct HookCommand {
    std::string program;
    std::vector<std::string> args;

    std::string display() const;
};

// One step's result, inclusive of all its retry attempts.
struct StepResult {
    std::string hook_name;
    int attempts_used = 0;
    Outcome outcome = Outcome::failed;
    int exit_code = 0;
    std::string captured_output;
    bool output_truncated = false;
    std::string error;         // invoker-level or resolution error, empty otherwise
    Millis elapsed{0};
};

enum class ChainStatus {
    not_started,
    running,
    completed,
    aborted,
};

const char* chain_status_name(ChainStatus s);

// Mutable state of one chain run. Lives on the orchestrator's stack.
struct ChainRunState {
    std::string current_input;
    int steps_executed = 0;
    int steps_failed = 0;
    bool aborted = false;
    Clock::time_point started_at = Clock::now();
};

struct ChainRunResult {
    std::string chain_name;
    ChainStatus status = ChainStatus::not_started;
    int steps_executed = 0;
    int steps_failed = 0;
    Millis duration{0};
    std::string final_output;
    std::string aborted_at;           // hook that aborted the chain, if any
    Outcome abort_outcome = Outcome::success;

    bool ok() const { return status == ChainStatus::completed; }

    // 0 completed, 124 aborted on a timed-out step, 1 any other abort.
    int exit_code() const;
};

} // namespace hookchain
