#pragma once
#include <string>
#include "types.hpp"

namespace hookchain {

// Result of exactly one process launch.
struct InvokeResult {
    Outcome outcome = Outcome::failed;
    int exit_code = 0;
    std::string output;          // stdout and stderr interleaved
    bool output_truncated = false;
    std::string error;           // set when the invoker itself failed (pipe, fork, thread)
    Millis elapsed{0};
};

class HookInvoker {
public:
    virtual ~HookInvoker() = default;

    // Runs `cmd` once with `input` on stdin. Never throws for process-level
    // failures; those are reported in the result.
    virtual InvokeResult invoke(const HookCommand& cmd, const std::string& input, Millis timeout) = 0;
};

// POSIX fork/exec implementation. The child gets its own process group so a
// timeout can take down anything it spawned.
class ProcessHookInvoker : public HookInvoker {
public:
    explicit ProcessHookInvoker(size_t max_output_bytes = 1 << 20)
        : max_output_bytes_(max_output_bytes) {}

    InvokeResult invoke(const HookCommand& cmd, const std::string& input, Millis timeout) override;

private:
    size_t max_output_bytes_;
};

} // namespace hookchain
