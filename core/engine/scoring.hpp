#pragma once

#include "engine/command.hpp"
#include "engine/game_state.hpp"
#include "puzzle/puzzle.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gitty {

enum class Performance {
    UNDER_PAR,
    AT_PAR,
    OVER_PAR
};

std::string performanceName(Performance performance);

/// Score summary for a won game.
struct GameRewards {
    int score = 0;
    int par_score = 0;
    int commands_used = 0;
    int commands_under_par = 0;  // negative when over par
    int bonus_points = 0;
    Performance performance = Performance::AT_PAR;
    std::vector<Command> optimal_solution;
};

/// 100 plus 20 per command under par; over par costs 10 per command,
/// never dropping below 10.
int calculateScore(int commands_used, int par_score);

/// Rewards for a finished game, or nullopt if the game was not won.
std::optional<GameRewards> computeRewards(const Puzzle& puzzle, const GameState& state);

} // namespace gitty
