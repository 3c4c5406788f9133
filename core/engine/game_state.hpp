#pragma once

#include "engine/command.hpp"
#include "engine/undo_stack.hpp"
#include "graph/graph.hpp"
#include "puzzle/file_target.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitty {

enum class GameStatus {
    IN_PROGRESS,
    WON,
    ABANDONED
};

std::string gameStatusName(GameStatus status);
std::optional<GameStatus> parseGameStatus(const std::string& name);

/// A successfully applied command and the message it produced.
struct CommandRecord {
    Command command;
    std::string message;
};

/// Per-session state. Only the executor mutates it; the host owns it and
/// must not hand the same state to two callers at once.
struct GameState {
    std::string puzzle_id;
    Graph graph;
    std::vector<FileTarget> files;
    std::vector<CommandRecord> command_history;
    UndoStack undo_stack;
    int commands_used = 0;
    int checkouts_used = 0;
    int consecutive_commits = 0;
    GameStatus status = GameStatus::IN_PROGRESS;
    int64_t started_at = 0;
    int64_t completed_at = 0;

    bool allFilesCollected() const;
    std::vector<std::string> collectedFileIds() const;
};

} // namespace gitty
