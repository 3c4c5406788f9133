// PyBind11 bindings for the gitty core.
// Exposes the graph, sessions, command parsing, solving and generation
// to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "engine/command.hpp"
#include "engine/command_executor.hpp"
#include "engine/command_parser.hpp"
#include "engine/command_result.hpp"
#include "engine/game_state.hpp"
#include "engine/scoring.hpp"
#include "graph/ancestry.hpp"
#include "graph/graph.hpp"
#include "graph/graph_validator.hpp"
#include "puzzle/puzzle.hpp"
#include "puzzle/puzzle_generator.hpp"
#include "search/bfs_solver.hpp"
#include "search/state_canonicalizer.hpp"
#include "serialization/json_codec.hpp"

namespace py = pybind11;

PYBIND11_MODULE(gitty_bindings, m) {
    m.doc() = "gitty C++ core bindings";

    // ── Enums ──
    py::enum_<gitty::CommandType>(m, "CommandType")
        .value("COMMIT", gitty::CommandType::COMMIT)
        .value("BRANCH", gitty::CommandType::BRANCH)
        .value("CHECKOUT", gitty::CommandType::CHECKOUT)
        .value("MERGE", gitty::CommandType::MERGE)
        .value("REBASE", gitty::CommandType::REBASE)
        .value("UNDO", gitty::CommandType::UNDO);

    py::enum_<gitty::ErrorKind>(m, "ErrorKind")
        .value("NONE", gitty::ErrorKind::NONE)
        .value("VALIDATION", gitty::ErrorKind::VALIDATION)
        .value("REFERENCE", gitty::ErrorKind::REFERENCE)
        .value("STATE", gitty::ErrorKind::STATE);

    py::enum_<gitty::GameStatus>(m, "GameStatus")
        .value("IN_PROGRESS", gitty::GameStatus::IN_PROGRESS)
        .value("WON", gitty::GameStatus::WON)
        .value("ABANDONED", gitty::GameStatus::ABANDONED);

    py::enum_<gitty::Difficulty>(m, "Difficulty")
        .value("EASY", gitty::Difficulty::EASY)
        .value("MEDIUM", gitty::Difficulty::MEDIUM)
        .value("HARD", gitty::Difficulty::HARD);

    // ── Commit / Branch ──
    py::class_<gitty::Commit>(m, "Commit")
        .def(py::init<>())
        .def_readwrite("id", &gitty::Commit::id)
        .def_readwrite("message", &gitty::Commit::message)
        .def_readwrite("parent_ids", &gitty::Commit::parent_ids)
        .def_readwrite("origin_branch", &gitty::Commit::origin_branch)
        .def_readwrite("depth", &gitty::Commit::depth)
        .def_readwrite("timestamp", &gitty::Commit::timestamp)
        .def("is_merge", &gitty::Commit::isMerge);

    py::class_<gitty::Branch>(m, "Branch")
        .def(py::init<>())
        .def_readwrite("name", &gitty::Branch::name)
        .def_readwrite("tip_commit_id", &gitty::Branch::tip_commit_id);

    // ── Graph ──
    py::class_<gitty::Graph>(m, "Graph")
        .def(py::init<>())
        .def_static("with_root", &gitty::Graph::withRoot,
                    py::arg("trunk"), py::arg("message") = "Initial commit")
        .def("add_commit", &gitty::Graph::addCommit,
             py::arg("message"), py::arg("parent_ids"), py::arg("origin_branch"),
             py::arg("timestamp") = 0)
        .def("get_commit", &gitty::Graph::getCommit, py::return_value_policy::reference_internal)
        .def("commit_ids", &gitty::Graph::commitIds)
        .def("commit_count", &gitty::Graph::commitCount)
        .def("add_branch", &gitty::Graph::addBranch)
        .def("get_branch", &gitty::Graph::getBranch, py::return_value_policy::reference_internal)
        .def("branch_count", &gitty::Graph::branchCount)
        .def("head_ref", [](const gitty::Graph& g) { return g.head().ref; })
        .def("is_detached", [](const gitty::Graph& g) { return g.head().isDetached(); })
        .def("is_ancestor", &gitty::Graph::isAncestor)
        .def("to_json", [](const gitty::Graph& g) { return gitty::encodeGraph(g).dump(); })
        .def_static("from_json", [](const std::string& text) {
            return gitty::decodeGraph(gitty::parseJson(text));
        });

    m.def("ancestors_of", &gitty::ancestorsOf);

    py::class_<gitty::ValidationIssue>(m, "ValidationIssue")
        .def(py::init<>())
        .def_readwrite("passed", &gitty::ValidationIssue::passed)
        .def_readwrite("check_name", &gitty::ValidationIssue::check_name)
        .def_readwrite("message", &gitty::ValidationIssue::message)
        .def_readwrite("commit_id", &gitty::ValidationIssue::commit_id);

    py::class_<gitty::GraphValidator>(m, "GraphValidator")
        .def(py::init<>())
        .def("check", &gitty::GraphValidator::check)
        .def("is_valid", &gitty::GraphValidator::isValid);

    // ── Commands ──
    py::class_<gitty::Command>(m, "Command")
        .def(py::init<>())
        .def_readwrite("type", &gitty::Command::type)
        .def_readwrite("argument", &gitty::Command::argument)
        .def("__str__", [](const gitty::Command& c) { return gitty::toString(c); });

    m.def("parse_command", &gitty::parseCommandString);
    m.def("is_valid_branch_name", &gitty::isValidBranchName);

    py::class_<gitty::FileTarget>(m, "FileTarget")
        .def(py::init<>())
        .def_readwrite("id", &gitty::FileTarget::id)
        .def_readwrite("name", &gitty::FileTarget::name)
        .def_readwrite("branch", &gitty::FileTarget::branch)
        .def_readwrite("depth", &gitty::FileTarget::depth)
        .def_readwrite("collected", &gitty::FileTarget::collected);

    py::class_<gitty::CommandResult>(m, "CommandResult")
        .def(py::init<>())
        .def_readwrite("success", &gitty::CommandResult::success)
        .def_readwrite("error", &gitty::CommandResult::error)
        .def_readwrite("message", &gitty::CommandResult::message)
        .def_readwrite("files_collected", &gitty::CommandResult::files_collected)
        .def_readwrite("game_won", &gitty::CommandResult::game_won);

    // ── Puzzle ──
    py::class_<gitty::PuzzleConstraints>(m, "PuzzleConstraints")
        .def(py::init<>())
        .def_readwrite("max_commands", &gitty::PuzzleConstraints::max_commands)
        .def_readwrite("max_commits", &gitty::PuzzleConstraints::max_commits)
        .def_readwrite("max_checkouts", &gitty::PuzzleConstraints::max_checkouts)
        .def_readwrite("max_branches", &gitty::PuzzleConstraints::max_branches)
        .def_readwrite("max_consecutive_commits", &gitty::PuzzleConstraints::max_consecutive_commits)
        .def_readwrite("allowed_commands", &gitty::PuzzleConstraints::allowed_commands);

    py::class_<gitty::Puzzle>(m, "Puzzle")
        .def(py::init<>())
        .def_readwrite("id", &gitty::Puzzle::id)
        .def_readwrite("date", &gitty::Puzzle::date)
        .def_readwrite("difficulty", &gitty::Puzzle::difficulty)
        .def_readwrite("trunk", &gitty::Puzzle::trunk)
        .def_readwrite("branch_names", &gitty::Puzzle::branch_names)
        .def_readwrite("initial_graph", &gitty::Puzzle::initial_graph)
        .def_readwrite("files", &gitty::Puzzle::files)
        .def_readwrite("constraints", &gitty::Puzzle::constraints)
        .def_readwrite("par_score", &gitty::Puzzle::par_score)
        .def_readwrite("solution", &gitty::Puzzle::solution)
        .def("to_json", [](const gitty::Puzzle& p) { return gitty::encodePuzzle(p).dump(); })
        .def_static("from_json", [](const std::string& text) {
            return gitty::decodePuzzle(gitty::parseJson(text));
        });

    // ── Sessions ──
    py::class_<gitty::GameState>(m, "GameState")
        .def_readonly("puzzle_id", &gitty::GameState::puzzle_id)
        .def_readonly("graph", &gitty::GameState::graph)
        .def_readonly("files", &gitty::GameState::files)
        .def_readonly("commands_used", &gitty::GameState::commands_used)
        .def_readonly("checkouts_used", &gitty::GameState::checkouts_used)
        .def_readonly("status", &gitty::GameState::status)
        .def("undo_depth", [](const gitty::GameState& s) { return s.undo_stack.size(); })
        .def("all_files_collected", &gitty::GameState::allFilesCollected)
        .def("to_json", [](const gitty::GameState& s) { return gitty::encodeGameState(s).dump(); });

    m.def("start_game", &gitty::startGame);
    m.def("apply_command", &gitty::applyCommand);
    m.def("undo", [](const gitty::Puzzle& puzzle, gitty::GameState& state) {
        return gitty::undo(puzzle, state);
    });

    py::class_<gitty::GameRewards>(m, "GameRewards")
        .def_readonly("score", &gitty::GameRewards::score)
        .def_readonly("par_score", &gitty::GameRewards::par_score)
        .def_readonly("commands_used", &gitty::GameRewards::commands_used)
        .def_readonly("bonus_points", &gitty::GameRewards::bonus_points)
        .def_readonly("optimal_solution", &gitty::GameRewards::optimal_solution)
        .def("performance", [](const gitty::GameRewards& r) {
            return gitty::performanceName(r.performance);
        });

    m.def("compute_rewards", &gitty::computeRewards);

    // ── Solver ──
    py::class_<gitty::SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("max_depth", &gitty::SolverConfig::max_depth)
        .def_readwrite("max_states", &gitty::SolverConfig::max_states)
        .def_readwrite("budget_seconds", &gitty::SolverConfig::budget_seconds);

    py::class_<gitty::SolveResult>(m, "SolveResult")
        .def(py::init<>())
        .def_readwrite("solved", &gitty::SolveResult::solved)
        .def_readwrite("par_score", &gitty::SolveResult::par_score)
        .def_readwrite("solution", &gitty::SolveResult::solution)
        .def_readwrite("states_visited", &gitty::SolveResult::states_visited)
        .def_readwrite("elapsed_seconds", &gitty::SolveResult::elapsed_seconds)
        .def_readwrite("budget_exhausted", &gitty::SolveResult::budget_exhausted);

    m.def("solve", [](const gitty::Puzzle& puzzle, const gitty::SolverConfig& config) {
        gitty::BfsSolver solver;
        return solver.solve(puzzle, config);
    }, py::arg("puzzle"), py::arg("config") = gitty::SolverConfig{});

    m.def("signature", [](const gitty::GameState& state) {
        gitty::StateCanonicalizer canon;
        return canon.compute(state.graph, state.files);
    });

    // ── Generator ──
    m.def("generate_daily", [](const std::string& date, gitty::Difficulty difficulty) {
        gitty::PuzzleGenerator generator;
        return generator.generateDaily(date, difficulty);
    }, py::arg("date"), py::arg("difficulty") = gitty::Difficulty::EASY);

    m.def("generate_archive", [](const std::string& archive_id, gitty::Difficulty difficulty) {
        gitty::PuzzleGenerator generator;
        return generator.generateArchive(archive_id, difficulty);
    }, py::arg("archive_id"), py::arg("difficulty") = gitty::Difficulty::EASY);
}
