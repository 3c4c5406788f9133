#pragma once

#include "engine/command.hpp"

#include <optional>
#include <string>

namespace gitty {

/// Parse a typed command line such as `git commit -m "msg"`,
/// `git checkout main`, `co feature` or `undo`.
/// The `git` prefix is optional. The command word is case-insensitive,
/// arguments keep their case. Aliases: co, ci, br, mg, rb.
/// Returns nullopt for unknown commands, missing arguments and invalid
/// branch names.
std::optional<Command> parseCommandString(const std::string& input);

/// Simplified git ref-name rules used for puzzle branch names.
bool isValidBranchName(const std::string& name);

} // namespace gitty
