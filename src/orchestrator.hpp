#pragma once
#include <string>
#include "types.hpp"
#include "config.hpp"
#include "hook_resolver.hpp"
#include "hook_invoker.hpp"
#include "reporter.hpp"

namespace hookchain {

// Runs a chain's hooks strictly in order. Per-step problems (hook missing,
// timeout, non-zero exit) are data in the StepResult and go through the
// failure policy; they are never thrown.
//
// Failure policy, evaluated once a step's retries are exhausted:
//   failed/timed out AND (hook is critical OR chain.stop_on_failure) -> abort
//   anything else                                                    -> continue
class ChainOrchestrator {
public:
    ChainOrchestrator(const Config& config,
                      const HookResolver& resolver,
                      HookInvoker& invoker,
                      Reporter& reporter)
        : config_(config), resolver_(resolver), invoker_(invoker), reporter_(reporter) {}

    // Unknown chain names resolve to an immediate no-op success.
    ChainRunResult run(const std::string& chain_name, const std::string& input);

    ChainRunResult run(const ChainDefinition& chain, const std::string& input);

private:
    const Config& config_;
    const HookResolver& resolver_;
    HookInvoker& invoker_;
    Reporter& reporter_;

    StepResult run_step(const ChainDefinition& chain, const std::string& hook,
                        const HookMetadata& meta, const std::string& input);
    void report_step(const ChainDefinition& chain, const StepResult& step);
    ChainRunResult skipped(const std::string& chain_name, const std::string& input,
                           const std::string& reason);
};

} // namespace hookchain
