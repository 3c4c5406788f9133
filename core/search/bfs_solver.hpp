#pragma once

#include "engine/command.hpp"
#include "engine/game_state.hpp"
#include "puzzle/puzzle.hpp"
#include "search/search_state.hpp"
#include "search/state_canonicalizer.hpp"

#include <string>
#include <vector>

namespace gitty {

/// Breadth-first search for the shortest winning command sequence.
/// Every edge is one legal command with uniform cost, so the first
/// winning state reached gives the par score. States are deduplicated by
/// their canonical signature plus the quota counters that still limit
/// later moves. Depth is bounded by the puzzle's maxCommands unless the
/// config overrides it.
class BfsSolver {
public:
    SolveResult solve(const Puzzle& puzzle, const SolverConfig& config = {}) const;

    /// Candidate commands from `state`: one commit, every creatable
    /// declared branch, checkout of every other branch and of every
    /// commit id, and merge/rebase with every other branch.
    static std::vector<Command> candidateMoves(const Puzzle& puzzle, const GameState& state);

    /// Replay `commands` from the puzzle's initial graph. True if every
    /// command succeeds and the last one, and only the last one, wins.
    static bool verify(const Puzzle& puzzle, const std::vector<Command>& commands);

private:
    static std::string searchKey(StateCanonicalizer& canon, const Puzzle& puzzle,
                                 const GameState& state);
};

} // namespace gitty
