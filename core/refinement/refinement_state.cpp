#include "refinement/refinement_state.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace atdd {

std::string phaseName(Phase phase) {
    switch (phase) {
        case Phase::Init:            return "init";
        case Phase::Iterating:       return "iterating";
        case Phase::Converged:       return "converged";
        case Phase::Stagnated:       return "stagnated";
        case Phase::BudgetExhausted: return "budgetExhausted";
        case Phase::Failed:          return "failed";
        case Phase::Cancelled:       return "cancelled";
    }
    return "unknown";
}

std::string candidateHash(const std::string& source) {
    uint64_t h = 14695981039346656037ull;
    for (unsigned char c : source) {
        h ^= c;
        h *= 1099511628211ull;
    }
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << h;
    return out.str();
}

const IterationRecord* RefinementState::best() const {
    if (best_index < 0 || best_index >= static_cast<int>(iterations.size())) return nullptr;
    return &iterations[best_index];
}

const IterationRecord* RefinementState::last() const {
    return iterations.empty() ? nullptr : &iterations.back();
}

std::string RefinementState::summary() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "phase=" << phaseName(phase)
        << " iterations=" << iterations.size()
        << " best_iteration=" << (best() ? best()->index : 0)
        << " best_pass_rate=" << best_pass_rate
        << " best_reward=" << best_reward << "\n";
    if (!stop_reason.empty()) out << "stop_reason: " << stop_reason << "\n";
    if (generation_errors > 0 || syntax_rejections > 0) {
        out << "generation_errors=" << generation_errors
            << " syntax_rejections=" << syntax_rejections << "\n";
    }

    for (const auto& it : iterations) {
        out << "  #" << it.index
            << " hash=" << it.candidate_hash
            << " passed=" << it.outcome.passed << "/" << it.outcome.total
            << " failed=" << it.outcome.failed
            << " errors=" << it.outcome.errored
            << " kind=" << errorKindName(it.analysis.error_kind)
            << " reward=" << it.reward.total
            << " duration=" << it.duration_seconds << "s\n";
    }

    if (const IterationRecord* tail = last(); tail && !tail->outcome.allPassed()) {
        out << "\nLast analysis:\n" << tail->analysis.feedback() << "\n";
    }
    return out.str();
}

} // namespace atdd
