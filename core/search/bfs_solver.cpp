#include "search/bfs_solver.hpp"
#include "engine/command_executor.hpp"
#include "search/budget_manager.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>
#include <utility>

namespace gitty {

namespace {

// Back-pointer used to rebuild the winning command sequence.
struct Trace {
    size_t parent;
    Command command;
};

constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

std::vector<Command> rebuildPath(const std::vector<Trace>& traces, size_t index) {
    std::vector<Command> path;
    while (index != kNoParent && traces[index].parent != kNoParent) {
        path.push_back(traces[index].command);
        index = traces[index].parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

std::string BfsSolver::searchKey(StateCanonicalizer& canon, const Puzzle& puzzle,
                                 const GameState& state) {
    std::string key = canon.compute(state.graph, state.files);
    key += "|c" + std::to_string(state.checkouts_used);
    key += "|n" + std::to_string(state.graph.commitCount());
    if (puzzle.constraints.max_consecutive_commits > 0) {
        key += "|k" + std::to_string(state.consecutive_commits);
    }
    return key;
}

std::vector<Command> BfsSolver::candidateMoves(const Puzzle& puzzle, const GameState& state) {
    const PuzzleConstraints& c = puzzle.constraints;
    const Graph& graph = state.graph;
    const Branch* current = graph.currentBranch();
    std::vector<Command> moves;

    if (c.allows(CommandType::COMMIT)) {
        moves.push_back(Command::commit());
    }
    if (c.allows(CommandType::BRANCH)) {
        for (const auto& name : puzzle.branch_names) {
            if (!graph.hasBranch(name)) moves.push_back(Command::branch(name));
        }
    }
    if (c.allows(CommandType::CHECKOUT)) {
        for (const auto& [name, _] : graph.branches()) {
            if (!current || current->name != name) moves.push_back(Command::checkout(name));
        }
        for (const auto& id : graph.commitIds()) {
            if (graph.head().isDetached() && graph.head().ref == id) continue;
            moves.push_back(Command::checkout(id));
        }
    }
    if (current) {
        for (const auto& [name, _] : graph.branches()) {
            if (name == current->name) continue;
            if (c.allows(CommandType::MERGE)) moves.push_back(Command::merge(name));
            if (c.allows(CommandType::REBASE)) moves.push_back(Command::rebase(name));
        }
    }
    return moves;
}

SolveResult BfsSolver::solve(const Puzzle& puzzle, const SolverConfig& config) const {
    BudgetManager budget(config);
    budget.start();

    const CommandExecutor executor(puzzle, /*recording=*/false);
    const int max_depth = config.max_depth > 0 ? config.max_depth : puzzle.constraints.max_commands;

    SolveResult result;
    StateCanonicalizer canon;
    std::unordered_set<std::string> visited;
    std::vector<Trace> traces;

    GameState initial = executor.newGame();
    visited.insert(searchKey(canon, puzzle, initial));
    budget.recordState();
    traces.push_back({kNoParent, Command::commit()});

    std::vector<std::pair<GameState, size_t>> layer;
    layer.emplace_back(std::move(initial), 0);

    for (int depth = 0; depth < max_depth && !layer.empty(); depth++) {
        std::vector<std::pair<GameState, size_t>> next;

        for (const auto& [state, trace_index] : layer) {
            for (const Command& move : candidateMoves(puzzle, state)) {
                GameState child = state;
                CommandResult r = executor.execute(child, move);
                if (!r.success) continue;

                if (r.game_won) {
                    traces.push_back({trace_index, move});
                    result.solved = true;
                    result.solution = rebuildPath(traces, traces.size() - 1);
                    result.par_score = static_cast<int>(result.solution.size());
                    result.max_depth_reached = depth + 1;
                    result.states_visited = budget.states();
                    result.elapsed_seconds = budget.elapsedSeconds();
                    gitty_log("Solved " + puzzle.id + " with par " +
                              std::to_string(result.par_score) + " after " +
                              std::to_string(result.states_visited) + " states", "Solver");
                    return result;
                }

                if (!visited.insert(searchKey(canon, puzzle, child)).second) continue;

                budget.recordState();
                if (!budget.canContinue()) {
                    result.budget_exhausted = true;
                    result.states_visited = budget.states();
                    result.max_depth_reached = depth + 1;
                    result.elapsed_seconds = budget.elapsedSeconds();
                    gitty_log("Search budget (" + budgetLimitName(budget.limitReached()) +
                              ") exhausted for " + puzzle.id + " at depth " +
                              std::to_string(depth + 1), "Solver");
                    return result;
                }

                traces.push_back({trace_index, move});
                next.emplace_back(std::move(child), traces.size() - 1);
            }
        }

        if (!next.empty()) result.max_depth_reached = depth + 1;
        layer = std::move(next);
    }

    result.states_visited = budget.states();
    result.elapsed_seconds = budget.elapsedSeconds();
    gitty_log("No solution for " + puzzle.id + " within " + std::to_string(max_depth) +
              " commands", "Solver");
    return result;
}

bool BfsSolver::verify(const Puzzle& puzzle, const std::vector<Command>& commands) {
    const CommandExecutor executor(puzzle, /*recording=*/false);
    GameState state = executor.newGame();

    for (size_t i = 0; i < commands.size(); i++) {
        CommandResult r = executor.execute(state, commands[i]);
        if (!r.success) return false;
        if (r.game_won != (i + 1 == commands.size())) return false;
    }
    return !commands.empty();
}

} // namespace gitty
