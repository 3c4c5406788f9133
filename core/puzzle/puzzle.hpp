#pragma once

#include "engine/command.hpp"
#include "graph/graph.hpp"
#include "puzzle/file_target.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace gitty {

enum class Difficulty {
    EASY,
    MEDIUM,
    HARD
};

std::string difficultyName(Difficulty difficulty);
std::optional<Difficulty> parseDifficulty(const std::string& name);

/// Per-puzzle limits. A zero max_consecutive_commits means unlimited.
struct PuzzleConstraints {
    int max_commands = 20;
    int max_commits = 15;
    int max_checkouts = 10;
    int max_branches = 5;
    int max_consecutive_commits = 0;
    std::vector<CommandType> allowed_commands = allCommandTypes();

    bool allows(CommandType type) const {
        return std::find(allowed_commands.begin(), allowed_commands.end(), type) !=
               allowed_commands.end();
    }
};

/// A generated puzzle. Immutable once published; every player of the
/// day starts from the same initial graph.
struct Puzzle {
    std::string id;
    std::optional<std::string> date;
    Difficulty difficulty = Difficulty::EASY;
    std::string trunk = "main";
    std::vector<std::string> branch_names;  // every name a player may create or use
    Graph initial_graph;
    std::vector<FileTarget> files;
    PuzzleConstraints constraints;
    int par_score = 0;
    std::vector<Command> solution;

    bool declaresBranch(const std::string& name) const {
        return std::find(branch_names.begin(), branch_names.end(), name) != branch_names.end();
    }
};

} // namespace gitty
