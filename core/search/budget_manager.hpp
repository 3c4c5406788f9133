#pragma once

#include "search/search_state.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace gitty {

enum class BudgetLimit {
    NONE,
    STATES,
    TIME
};

inline std::string budgetLimitName(BudgetLimit limit) {
    switch (limit) {
        case BudgetLimit::NONE:   return "none";
        case BudgetLimit::STATES: return "states";
        case BudgetLimit::TIME:   return "time";
    }
    return "unknown";
}

// ─── Budget Manager ────────────────────────────────────────────
// Counts the distinct states a solver run admits and stops it at the
// configured state or wall-clock limit, whichever comes first. A limit
// of 0 is unlimited. The clock is sampled once every kClockStride
// states, so a time limit may overrun by that many states.

class BudgetManager {
public:
    static constexpr size_t kClockStride = 256;

    explicit BudgetManager(const SolverConfig& config)
        : max_states_(config.max_states), max_seconds_(config.budget_seconds) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        states_ = 0;
        hit_ = BudgetLimit::NONE;
    }

    /// Count one admitted state and latch the first limit reached.
    void recordState() {
        states_++;
        if (hit_ != BudgetLimit::NONE) return;
        if (max_states_ > 0 && states_ >= max_states_) {
            hit_ = BudgetLimit::STATES;
        } else if (max_seconds_ > 0 && states_ % kClockStride == 0 &&
                   elapsedSeconds() >= max_seconds_) {
            hit_ = BudgetLimit::TIME;
        }
    }

    bool canContinue() const { return hit_ == BudgetLimit::NONE; }
    BudgetLimit limitReached() const { return hit_; }

    size_t states() const { return states_; }

    double elapsedSeconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    }

private:
    size_t max_states_;
    double max_seconds_;
    size_t states_ = 0;
    BudgetLimit hit_ = BudgetLimit::NONE;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace gitty
