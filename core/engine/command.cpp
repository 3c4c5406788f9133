#include "engine/command.hpp"

namespace gitty {

std::string commandTypeName(CommandType type) {
    switch (type) {
        case CommandType::COMMIT:   return "commit";
        case CommandType::BRANCH:   return "branch";
        case CommandType::CHECKOUT: return "checkout";
        case CommandType::MERGE:    return "merge";
        case CommandType::REBASE:   return "rebase";
        case CommandType::UNDO:     return "undo";
    }
    return "unknown";
}

std::optional<CommandType> parseCommandType(const std::string& name) {
    for (CommandType type : allCommandTypes()) {
        if (commandTypeName(type) == name) return type;
    }
    return std::nullopt;
}

const std::vector<CommandType>& allCommandTypes() {
    static const std::vector<CommandType> types = {
        CommandType::COMMIT, CommandType::BRANCH, CommandType::CHECKOUT,
        CommandType::MERGE, CommandType::REBASE, CommandType::UNDO,
    };
    return types;
}

std::string toString(const Command& command) {
    switch (command.type) {
        case CommandType::COMMIT:
            return "git commit -m \"" + command.argument + "\"";
        case CommandType::UNDO:
            return "undo";
        default:
            return "git " + commandTypeName(command.type) + " " + command.argument;
    }
}

} // namespace gitty
