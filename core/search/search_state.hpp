#pragma once

#include "engine/command.hpp"
#include <cstddef>
#include <vector>

namespace gitty {

/// Solver configuration parameters.
struct SolverConfig {
    int max_depth = 0;               // 0 = use the puzzle's maxCommands
    size_t max_states = 2000000;     // Maximum distinct states visited
    double budget_seconds = 60.0;    // Maximum wall-clock time
};

/// Result of a solver run.
struct SolveResult {
    bool solved = false;
    int par_score = 0;
    std::vector<Command> solution;
    size_t states_visited = 0;
    int max_depth_reached = 0;
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;
};

} // namespace gitty
