#pragma once

#include "puzzle/file_target.hpp"

#include <string>
#include <vector>

namespace gitty {

/// Why a command was rejected.
enum class ErrorKind {
    NONE,
    VALIDATION,  // disallowed command, quota exhausted, malformed argument, game over
    REFERENCE,   // unknown branch or commit
    STATE        // detached HEAD for merge/rebase, empty undo stack
};

std::string errorKindName(ErrorKind kind);

/// Outcome of one command. Failures are reported here, never thrown,
/// and leave the game state untouched.
struct CommandResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::vector<FileTarget> files_collected;
    bool game_won = false;

    static CommandResult ok(std::string message) {
        CommandResult r;
        r.success = true;
        r.message = std::move(message);
        return r;
    }

    static CommandResult fail(ErrorKind kind, std::string message) {
        CommandResult r;
        r.error = kind;
        r.message = std::move(message);
        return r;
    }
};

} // namespace gitty
