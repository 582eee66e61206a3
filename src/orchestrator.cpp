#include "orchestrator.hpp"
#include "retry_controller.hpp"

namespace hookchain {

ChainRunResult ChainOrchestrator::skipped(const std::string& chain_name, const std::string& input,
                                          const std::string& reason) {
    ChainEvent ev;
    ev.kind = EventKind::chain_skipped;
    ev.chain = chain_name;
    ev.message = reason;
    reporter_.report(ev);

    ChainRunResult r;
    r.chain_name = chain_name;
    r.status = ChainStatus::completed;
    r.final_output = input;
    return r;
}

ChainRunResult ChainOrchestrator::run(const std::string& chain_name, const std::string& input) {
    auto chain = config_.find_chain(chain_name);
    if (!chain) return skipped(chain_name, input, "chain not found");
    return run(*chain, input);
}

StepResult ChainOrchestrator::run_step(const ChainDefinition& chain, const std::string& hook,
                                       const HookMetadata& meta, const std::string& input) {
    auto cmd = resolver_.resolve(hook);
    if (!cmd) {
        StepResult r;
        r.hook_name = hook;
        r.attempts_used = 0;
        r.outcome = Outcome::failed;
        r.exit_code = kNotFoundExitCode;
        r.error = "hook not found";
        return r;
    }

    RetryController retry(invoker_, reporter_);
    return retry.run(chain.name, hook, *cmd, meta, input);
}

void ChainOrchestrator::report_step(const ChainDefinition& chain, const StepResult& step) {
    ChainEvent ev;
    ev.chain = chain.name;
    ev.hook = step.hook_name;
    ev.attempt = step.attempts_used;
    ev.max_attempts = config_.metadata_for(step.hook_name).max_attempts();
    ev.outcome = step.outcome;
    ev.exit_code = step.exit_code;
    ev.elapsed = step.elapsed;
    ev.message = step.error;
    if (step.output_truncated) {
        ev.message += ev.message.empty() ? "output truncated" : "; output truncated";
    }

    switch (step.outcome) {
    case Outcome::success:   ev.kind = EventKind::step_success; break;
    case Outcome::timed_out: ev.kind = EventKind::step_timeout; break;
    case Outcome::failed:    ev.kind = EventKind::step_failure; break;
    }
    reporter_.report(ev);
}

ChainRunResult ChainOrchestrator::run(const ChainDefinition& chain, const std::string& input) {
    if (!chain.enabled) return skipped(chain.name, input, "chain disabled");

    ChainRunResult result;
    result.chain_name = chain.name;
    result.status = ChainStatus::running;

    ChainRunState state;
    state.current_input = input;
    state.started_at = Clock::now();

    {
        ChainEvent ev;
        ev.kind = EventKind::chain_start;
        ev.chain = chain.name;
        ev.message = std::to_string(chain.sequence.size()) + " step(s)";
        reporter_.report(ev);
    }

    for (auto& hook : chain.sequence) {
        HookMetadata meta = config_.metadata_for(hook);
        StepResult step = run_step(chain, hook, meta, state.current_input);
        report_step(chain, step);

        state.steps_executed++;
        if (step.outcome != Outcome::success) {
            state.steps_failed++;
            if (meta.critical || chain.stop_on_failure) {
                state.aborted = true;
                result.aborted_at = hook;
                result.abort_outcome = step.outcome;
                break;
            }
        }

        if (chain.propagate_output && !step.captured_output.empty()) {
            state.current_input = std::move(step.captured_output);

            ChainEvent ev;
            ev.kind = EventKind::output_propagated;
            ev.chain = chain.name;
            ev.hook = hook;
            ev.message = std::to_string(state.current_input.size()) + " bytes";
            reporter_.report(ev);
        }
    }

    result.status = state.aborted ? ChainStatus::aborted : ChainStatus::completed;
    result.steps_executed = state.steps_executed;
    result.steps_failed = state.steps_failed;
    result.duration = std::chrono::duration_cast<Millis>(Clock::now() - state.started_at);
    result.final_output = std::move(state.current_input);

    ChainEvent ev;
    ev.kind = EventKind::chain_complete;
    ev.chain = chain.name;
    ev.elapsed = result.duration;
    ev.message = std::string(chain_status_name(result.status)) + ", " +
                 std::to_string(result.steps_executed) + " executed, " +
                 std::to_string(result.steps_failed) + " failed";
    if (!result.aborted_at.empty()) ev.message += ", aborted at " + result.aborted_at;
    reporter_.report(ev);

    return result;
}

} // namespace hookchain
