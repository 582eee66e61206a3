#include "types.hpp"

namespace hookchain {

const char* outcome_name(Outcome o) {
    switch (o) {
    case Outcome::success:   return "success";
    case Outcome::timed_out: return "timed_out";
    case Outcome::failed:    return "failed";
    }
    return "failed";
}

const char* chain_status_name(ChainStatus s) {
    switch (s) {
    case ChainStatus::not_started: return "not_started";
    case ChainStatus::running:     return "running";
    case ChainStatus::completed:   return "completed";
    case ChainStatus::aborted:     return "aborted";
    }
    return "not_started";
}

std::string HookCommand::display() const {
    std::string s = program;
    for (auto& a : args) {
        s += " ";
        s += a;
    }
    return s;
}

int ChainRunResult::exit_code() const {
    if (status != ChainStatus::aborted) return 0;
    return abort_outcome == Outcome::timed_out ? kTimeoutExitCode : 1;
}

} // namespace hookchain
