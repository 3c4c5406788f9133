#pragma once

#include "engine/command.hpp"
#include "engine/command_result.hpp"
#include "engine/game_state.hpp"
#include "puzzle/puzzle.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gitty {

/// Applies commands to a GameState under the rules of one puzzle.
///
/// Every command is checked against the allowed command types and the
/// quotas before anything changes. Rejections come back as a failed
/// CommandResult and leave the state exactly as it was, quotas included.
/// Successful commands snapshot the previous graph and files onto the
/// undo stack, update the counters, and set the status to WON when the
/// win predicate fires.
///
/// The executor keeps a reference to the puzzle; the puzzle must outlive it.
class CommandExecutor {
public:
    /// With `recording` off, no undo snapshots or history are kept.
    /// The solver runs this way.
    explicit CommandExecutor(const Puzzle& puzzle, bool recording = true)
        : puzzle_(puzzle), recording_(recording) {}

    /// Fresh session state for the puzzle.
    GameState newGame() const;

    CommandResult execute(GameState& state, const Command& command) const;

    /// Restore the most recent snapshot.
    CommandResult undo(GameState& state) const;

    /// Win predicate: every file collected, `advanced_branch` is the trunk,
    /// and every file position is present in the trunk's history.
    bool isWinning(const GameState& state, const std::string& advanced_branch) const;

    const Puzzle& puzzle() const { return puzzle_; }

private:
    std::optional<CommandResult> checkQuotas(const GameState& state, const Command& command) const;

    CommandResult commit(GameState& state, const std::string& message) const;
    CommandResult createBranch(GameState& state, const std::string& name) const;
    CommandResult checkout(GameState& state, const std::string& target) const;
    CommandResult merge(GameState& state, const std::string& branch) const;
    CommandResult rebase(GameState& state, const std::string& onto) const;

    const Puzzle& puzzle_;
    bool recording_;
};

/// Mark every uncollected file at (branch, depth) collected and return them.
std::vector<FileTarget> collectFilesAt(std::vector<FileTarget>& files,
                                       const std::string& branch, int depth);

// ── Session entry points ──

/// New session state for `puzzle`.
GameState startGame(const Puzzle& puzzle);

/// Apply one command; `undo` commands are routed to undo().
CommandResult applyCommand(const Puzzle& puzzle, GameState& state, const Command& command);

/// Undo the last successful command. False (and no change) when there
/// is nothing to undo or the game has ended.
bool undo(const Puzzle& puzzle, GameState& state);

} // namespace gitty
