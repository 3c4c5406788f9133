#pragma once

#include "engine/command.hpp"
#include "engine/command_result.hpp"
#include "engine/game_state.hpp"
#include "engine/scoring.hpp"
#include "session/puzzle_store.hpp"
#include "session/session_store.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace gitty {

/// Outcome of a session call: the command result and the state after it.
struct SessionReply {
    CommandResult result;
    GameState state;
};

// ─── Session Manager ───────────────────────────────────────────
// Single writer for player sessions, one per (user, puzzle) pair.
// Each call hydrates the checkpointed state, applies the command, and
// checkpoints again after every successful mutation before returning.
// Failed commands leave the checkpoint untouched.

class SessionManager {
public:
    SessionManager(const PuzzleStore& puzzles, SessionStore& sessions)
        : puzzles_(puzzles), sessions_(sessions) {}

    /// Checkpointed state, or nullopt if the user never started the puzzle.
    std::optional<GameState> hydrate(const std::string& puzzle_id,
                                     const std::string& user_id) const;

    /// Hydrate, or start and checkpoint a fresh session.
    /// Throws std::runtime_error if the puzzle does not exist.
    GameState open(const std::string& puzzle_id, const std::string& user_id);

    SessionReply submit(const std::string& puzzle_id, const std::string& user_id,
                        const Command& command);

    /// Parse a typed command line and submit it. Unparseable input is a
    /// Validation failure that leaves the store untouched; the reply then
    /// carries the checkpointed state, or a fresh unsaved one.
    SessionReply submitLine(const std::string& puzzle_id, const std::string& user_id,
                            const std::string& line);

    SessionReply undo(const std::string& puzzle_id, const std::string& user_id);

    /// Mark an in-progress session abandoned. False if there is no such
    /// session or it has already ended.
    bool abandon(const std::string& puzzle_id, const std::string& user_id);

    /// Rewards for a won session.
    std::optional<GameRewards> rewards(const std::string& puzzle_id,
                                       const std::string& user_id) const;

    static std::string sessionKey(const std::string& puzzle_id, const std::string& user_id);

private:
    Puzzle requirePuzzle(const std::string& puzzle_id) const;
    GameState openLocked(const Puzzle& puzzle, const std::string& key);

    const PuzzleStore& puzzles_;
    SessionStore& sessions_;
    mutable std::mutex mutex_;
};

} // namespace gitty
