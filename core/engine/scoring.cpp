#include "engine/scoring.hpp"

#include <algorithm>

namespace gitty {

std::string performanceName(Performance performance) {
    switch (performance) {
        case Performance::UNDER_PAR: return "under_par";
        case Performance::AT_PAR:    return "at_par";
        case Performance::OVER_PAR:  return "over_par";
    }
    return "unknown";
}

int calculateScore(int commands_used, int par_score) {
    const int base = 100;
    const int diff = par_score - commands_used;
    if (diff >= 0) {
        return base + diff * 20;
    }
    return std::max(10, base + diff * 10);
}

std::optional<GameRewards> computeRewards(const Puzzle& puzzle, const GameState& state) {
    if (state.status != GameStatus::WON) return std::nullopt;

    GameRewards rewards;
    rewards.par_score = puzzle.par_score;
    rewards.commands_used = state.commands_used;
    rewards.commands_under_par = puzzle.par_score - state.commands_used;
    rewards.score = calculateScore(state.commands_used, puzzle.par_score);
    rewards.bonus_points = std::max(0, rewards.commands_under_par * 20);
    if (rewards.commands_under_par > 0) {
        rewards.performance = Performance::UNDER_PAR;
    } else if (rewards.commands_under_par == 0) {
        rewards.performance = Performance::AT_PAR;
    } else {
        rewards.performance = Performance::OVER_PAR;
    }
    rewards.optimal_solution = puzzle.solution;
    return rewards;
}

} // namespace gitty
