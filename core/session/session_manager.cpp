#include "session/session_manager.hpp"
#include "engine/command_executor.hpp"
#include "engine/command_parser.hpp"
#include "util/log.hpp"

#include <chrono>
#include <stdexcept>

namespace gitty {

std::string SessionManager::sessionKey(const std::string& puzzle_id, const std::string& user_id) {
    return user_id + "/" + puzzle_id;
}

Puzzle SessionManager::requirePuzzle(const std::string& puzzle_id) const {
    auto puzzle = puzzles_.load(puzzle_id);
    if (!puzzle) {
        throw std::runtime_error("Puzzle not found: " + puzzle_id);
    }
    return std::move(*puzzle);
}

std::optional<GameState> SessionManager::hydrate(const std::string& puzzle_id,
                                                 const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.load(sessionKey(puzzle_id, user_id));
}

GameState SessionManager::openLocked(const Puzzle& puzzle, const std::string& key) {
    if (auto existing = sessions_.load(key)) {
        return std::move(*existing);
    }
    GameState state = startGame(puzzle);
    sessions_.save(key, state);
    gitty_log("Started session " + key, "Session");
    return state;
}

GameState SessionManager::open(const std::string& puzzle_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openLocked(requirePuzzle(puzzle_id), sessionKey(puzzle_id, user_id));
}

SessionReply SessionManager::submit(const std::string& puzzle_id, const std::string& user_id,
                                    const Command& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Puzzle puzzle = requirePuzzle(puzzle_id);
    const std::string key = sessionKey(puzzle_id, user_id);

    SessionReply reply{CommandResult{}, openLocked(puzzle, key)};
    reply.result = applyCommand(puzzle, reply.state, command);
    if (reply.result.success) {
        sessions_.save(key, reply.state);
    }
    return reply;
}

SessionReply SessionManager::submitLine(const std::string& puzzle_id, const std::string& user_id,
                                        const std::string& line) {
    auto command = parseCommandString(line);
    if (!command) {
        // Rejected input never creates a checkpoint.
        std::lock_guard<std::mutex> lock(mutex_);
        const Puzzle puzzle = requirePuzzle(puzzle_id);
        auto existing = sessions_.load(sessionKey(puzzle_id, user_id));
        return SessionReply{CommandResult::fail(ErrorKind::VALIDATION,
                                                "Unrecognized command: " + line),
                            existing ? std::move(*existing) : startGame(puzzle)};
    }
    return submit(puzzle_id, user_id, *command);
}

SessionReply SessionManager::undo(const std::string& puzzle_id, const std::string& user_id) {
    return submit(puzzle_id, user_id, Command::undo());
}

bool SessionManager::abandon(const std::string& puzzle_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = sessionKey(puzzle_id, user_id);
    auto state = sessions_.load(key);
    if (!state || state->status != GameStatus::IN_PROGRESS) {
        return false;
    }
    state->status = GameStatus::ABANDONED;
    state->completed_at = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sessions_.save(key, *state);
    gitty_log("Abandoned session " + key, "Session");
    return true;
}

std::optional<GameRewards> SessionManager::rewards(const std::string& puzzle_id,
                                                   const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = sessions_.load(sessionKey(puzzle_id, user_id));
    if (!state) return std::nullopt;
    return computeRewards(requirePuzzle(puzzle_id), *state);
}

} // namespace gitty
