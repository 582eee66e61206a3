#include "retry_controller.hpp"

namespace hookchain {

StepResult RetryController::run(const std::string& chain_name,
                                const std::string& hook_name,
                                const HookCommand& cmd,
                                const HookMetadata& meta,
                                const std::string& input) {
    const int max_attempts = meta.max_attempts();
    const Millis timeout = std::chrono::seconds(meta.timeout_seconds);
    auto started = Clock::now();

    InvokeResult last;
    int attempt = 0;
    while (attempt < max_attempts) {
        ++attempt;

        ChainEvent ev;
        ev.kind = EventKind::attempt;
        ev.chain = chain_name;
        ev.hook = hook_name;
        ev.attempt = attempt;
        ev.max_attempts = max_attempts;
        ev.message = cmd.display();
        reporter_.report(ev);

        last = invoker_.invoke(cmd, input, timeout);
        if (last.outcome == Outcome::success) break;

        if (attempt < max_attempts) {
            ev.kind = EventKind::attempt_failed;
            ev.outcome = last.outcome;
            ev.exit_code = last.exit_code;
            ev.elapsed = last.elapsed;
            ev.message = last.error;
            reporter_.report(ev);
        }
    }

    StepResult r;
    r.hook_name = hook_name;
    r.attempts_used = attempt;
    r.outcome = last.outcome;
    r.exit_code = last.exit_code;
    r.captured_output = std::move(last.output);
    r.output_truncated = last.output_truncated;
    r.error = std::move(last.error);
    r.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - started);
    return r;
}

} // namespace hookchain
