#pragma once
#include <string>
#include "types.hpp"
#include "hook_invoker.hpp"
#include "reporter.hpp"

namespace hookchain {

// Bounded attempt loop around a HookInvoker. Timeouts and failures are both
// retried, immediately, until success or meta.max_attempts() is used up.
class RetryController {
public:
    RetryController(HookInvoker& invoker, Reporter& reporter)
        : invoker_(invoker), reporter_(reporter) {}

    // On exhaustion the result carries the last attempt's outcome, exit code
    // and output as-is. `elapsed` spans all attempts.
    StepResult run(const std::string& chain_name,
                   const std::string& hook_name,
                   const HookCommand& cmd,
                   const HookMetadata& meta,
                   const std::string& input);

private:
    HookInvoker& invoker_;
    Reporter& reporter_;
};

} // namespace hookchain
