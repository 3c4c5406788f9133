#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitty {

enum class CommandType {
    COMMIT,
    BRANCH,
    CHECKOUT,
    MERGE,
    REBASE,
    UNDO
};

/// One player command. `argument` holds the commit message, the branch
/// name to create, the checkout target, the branch to merge, or the
/// branch to rebase onto, depending on `type`. Undo takes no argument.
struct Command {
    CommandType type = CommandType::COMMIT;
    std::string argument;

    static Command commit(std::string message = "Commit") { return {CommandType::COMMIT, std::move(message)}; }
    static Command branch(std::string name) { return {CommandType::BRANCH, std::move(name)}; }
    static Command checkout(std::string target) { return {CommandType::CHECKOUT, std::move(target)}; }
    static Command merge(std::string branch) { return {CommandType::MERGE, std::move(branch)}; }
    static Command rebase(std::string onto) { return {CommandType::REBASE, std::move(onto)}; }
    static Command undo() { return {CommandType::UNDO, {}}; }

    bool operator==(const Command& other) const {
        return type == other.type && argument == other.argument;
    }
    bool operator!=(const Command& other) const { return !(*this == other); }
};

/// Wire name of a command type ("commit", "branch", ...).
std::string commandTypeName(CommandType type);

/// Inverse of commandTypeName.
std::optional<CommandType> parseCommandType(const std::string& name);

/// Every command type, in declaration order.
const std::vector<CommandType>& allCommandTypes();

/// Render as the command line a player would type.
std::string toString(const Command& command);

} // namespace gitty
