#include "serialization/json_codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace gitty {

namespace {

const json& member(const json& j, const char* key) {
    if (!j.is_object()) {
        throw DecodeError(std::string("Expected an object holding '") + key + "'");
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw DecodeError(std::string("Missing field '") + key + "'");
    }
    return *it;
}

template <typename T>
T field(const json& j, const char* key) {
    try {
        return member(j, key).get<T>();
    } catch (const json::exception& e) {
        throw DecodeError(std::string("Field '") + key + "': " + e.what());
    }
}

template <typename T>
T fieldOr(const json& j, const char* key, T fallback) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return fallback;
    return field<T>(j, key);
}

const json& objectField(const json& j, const char* key) {
    const json& value = member(j, key);
    if (!value.is_object()) {
        throw DecodeError(std::string("Field '") + key + "' must be an object");
    }
    return value;
}

const json& arrayField(const json& j, const char* key) {
    const json& value = member(j, key);
    if (!value.is_array()) {
        throw DecodeError(std::string("Field '") + key + "' must be an array");
    }
    return value;
}

const char* payloadKey(CommandType type) {
    switch (type) {
        case CommandType::COMMIT:   return "message";
        case CommandType::BRANCH:   return "name";
        case CommandType::CHECKOUT: return "target";
        case CommandType::MERGE:    return "branch";
        case CommandType::REBASE:   return "onto";
        case CommandType::UNDO:     return nullptr;
    }
    return nullptr;
}

CommandType decodeCommandType(const json& value) {
    if (!value.is_string()) throw DecodeError("Command type must be a string");
    auto type = parseCommandType(value.get<std::string>());
    if (!type) throw DecodeError("Unknown command type: " + value.get<std::string>());
    return *type;
}

json encodeFiles(const std::vector<FileTarget>& files) {
    json arr = json::array();
    for (const auto& f : files) arr.push_back(encodeFileTarget(f));
    return arr;
}

std::vector<FileTarget> decodeFiles(const json& arr) {
    std::vector<FileTarget> files;
    for (const auto& f : arr) files.push_back(decodeFileTarget(f));
    return files;
}

} // namespace

// ─── Graph ─────────────────────────────────────────────────────

json encodeGraph(const Graph& graph) {
    json commits = json::object();
    for (const auto& id : graph.commitIds()) {
        const Commit* c = graph.getCommit(id);
        commits[id] = {
            {"id", c->id},
            {"message", c->message},
            {"parentIds", c->parent_ids},
            {"originBranch", c->origin_branch},
            {"depth", c->depth},
            {"timestamp", c->timestamp},
        };
    }

    json branches = json::object();
    for (const auto& [name, branch] : graph.branches()) {
        branches[name] = {{"name", name}, {"tipCommitId", branch.tip_commit_id}};
    }

    return {
        {"commits", std::move(commits)},
        {"branches", std::move(branches)},
        {"headRef", graph.head().ref},
        {"isDetached", graph.head().isDetached()},
    };
}

Graph decodeGraph(const json& j) {
    std::vector<Commit> pending;
    for (const auto& item : objectField(j, "commits").items()) {
        const std::string& key = item.key();
        const json& c = item.value();
        Commit commit;
        commit.id = fieldOr<std::string>(c, "id", key);
        if (commit.id != key) {
            throw DecodeError("Commit keyed '" + key + "' carries id '" + commit.id + "'");
        }
        commit.message = fieldOr<std::string>(c, "message", "");
        commit.parent_ids = field<std::vector<std::string>>(c, "parentIds");
        commit.origin_branch = field<std::string>(c, "originBranch");
        commit.depth = field<int>(c, "depth");
        commit.timestamp = fieldOr<int64_t>(c, "timestamp", 0);
        pending.push_back(std::move(commit));
    }

    Graph graph;
    try {
        // Insert in record order, deferring any commit whose parents have
        // not been inserted yet.
        while (!pending.empty()) {
            std::vector<Commit> deferred;
            for (auto& commit : pending) {
                bool ready = std::all_of(commit.parent_ids.begin(), commit.parent_ids.end(),
                                         [&](const std::string& p) { return graph.hasCommit(p); });
                if (ready) {
                    graph.insertCommit(commit);
                } else {
                    deferred.push_back(std::move(commit));
                }
            }
            if (deferred.size() == pending.size()) {
                throw DecodeError("Commit " + deferred.front().id + " references a missing parent");
            }
            pending = std::move(deferred);
        }

        for (const auto& item : objectField(j, "branches").items()) {
            graph.addBranch(fieldOr<std::string>(item.value(), "name", item.key()),
                            field<std::string>(item.value(), "tipCommitId"));
        }

        if (graph.commitCount() > 0) {
            std::string ref = field<std::string>(j, "headRef");
            graph.setHead(field<bool>(j, "isDetached") ? Head::detached(ref) : Head::attached(ref));
        }
    } catch (const DecodeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("Invalid graph: ") + e.what());
    }
    return graph;
}

// ─── Puzzle data ───────────────────────────────────────────────

json encodeFileTarget(const FileTarget& file) {
    return {
        {"id", file.id},
        {"name", file.name},
        {"branch", file.branch},
        {"depth", file.depth},
        {"collected", file.collected},
    };
}

FileTarget decodeFileTarget(const json& j) {
    FileTarget file;
    file.id = field<std::string>(j, "id");
    file.name = field<std::string>(j, "name");
    file.branch = field<std::string>(j, "branch");
    file.depth = field<int>(j, "depth");
    file.collected = fieldOr<bool>(j, "collected", false);
    if (file.depth < 1) {
        throw DecodeError("File " + file.id + " must sit at depth 1 or deeper");
    }
    return file;
}

json encodeConstraints(const PuzzleConstraints& constraints) {
    json allowed = json::array();
    for (CommandType type : constraints.allowed_commands) allowed.push_back(commandTypeName(type));
    return {
        {"maxCommands", constraints.max_commands},
        {"maxCommits", constraints.max_commits},
        {"maxCheckouts", constraints.max_checkouts},
        {"maxBranches", constraints.max_branches},
        {"maxConsecutiveCommits", constraints.max_consecutive_commits},
        {"allowedCommands", std::move(allowed)},
    };
}

PuzzleConstraints decodeConstraints(const json& j) {
    PuzzleConstraints c;
    c.max_commands = field<int>(j, "maxCommands");
    c.max_commits = field<int>(j, "maxCommits");
    c.max_checkouts = field<int>(j, "maxCheckouts");
    c.max_branches = field<int>(j, "maxBranches");
    c.max_consecutive_commits = fieldOr<int>(j, "maxConsecutiveCommits", 0);
    if (j.contains("allowedCommands")) {
        c.allowed_commands.clear();
        for (const auto& name : arrayField(j, "allowedCommands")) {
            c.allowed_commands.push_back(decodeCommandType(name));
        }
    }
    return c;
}

json encodePuzzle(const Puzzle& puzzle) {
    json solution = json::array();
    for (const auto& cmd : puzzle.solution) solution.push_back(encodeCommand(cmd));
    return {
        {"id", puzzle.id},
        {"date", puzzle.date ? json(*puzzle.date) : json(nullptr)},
        {"difficulty", difficultyName(puzzle.difficulty)},
        {"trunk", puzzle.trunk},
        {"branchNames", puzzle.branch_names},
        {"initialGraph", encodeGraph(puzzle.initial_graph)},
        {"files", encodeFiles(puzzle.files)},
        {"constraints", encodeConstraints(puzzle.constraints)},
        {"parScore", puzzle.par_score},
        {"solution", std::move(solution)},
    };
}

Puzzle decodePuzzle(const json& j) {
    Puzzle puzzle;
    puzzle.id = field<std::string>(j, "id");
    if (j.contains("date") && !j.at("date").is_null()) {
        puzzle.date = field<std::string>(j, "date");
    }
    auto difficulty = parseDifficulty(field<std::string>(j, "difficulty"));
    if (!difficulty) throw DecodeError("Unknown difficulty in puzzle " + puzzle.id);
    puzzle.difficulty = *difficulty;
    puzzle.trunk = fieldOr<std::string>(j, "trunk", "main");
    puzzle.branch_names = field<std::vector<std::string>>(j, "branchNames");
    puzzle.initial_graph = decodeGraph(member(j, "initialGraph"));
    puzzle.files = decodeFiles(arrayField(j, "files"));
    puzzle.constraints = decodeConstraints(member(j, "constraints"));
    puzzle.par_score = field<int>(j, "parScore");
    if (j.contains("solution")) {
        for (const auto& cmd : arrayField(j, "solution")) {
            puzzle.solution.push_back(decodeCommand(cmd));
        }
    }
    return puzzle;
}

// ─── Commands ──────────────────────────────────────────────────

json encodeCommand(const Command& command) {
    json j = {{"type", commandTypeName(command.type)}};
    if (const char* key = payloadKey(command.type)) {
        j[key] = command.argument;
    }
    return j;
}

Command decodeCommand(const json& j) {
    Command command;
    command.type = decodeCommandType(member(j, "type"));
    const char* key = payloadKey(command.type);
    if (command.type == CommandType::COMMIT) {
        command.argument = fieldOr<std::string>(j, key, "Commit");
    } else if (key) {
        command.argument = field<std::string>(j, key);
    }
    return command;
}

json encodeCommandResult(const CommandResult& result) {
    json j = {
        {"success", result.success},
        {"message", result.message},
        {"filesCollected", encodeFiles(result.files_collected)},
        {"gameWon", result.game_won},
    };
    j["error"] = result.error == ErrorKind::NONE ? json(nullptr) : json(errorKindName(result.error));
    return j;
}

json encodeCommandResponse(const CommandResult& result, const GameState& state) {
    json j = encodeCommandResult(result);
    j["graph"] = encodeGraph(state.graph);
    j["files"] = encodeFiles(state.files);
    j["commandsUsed"] = state.commands_used;
    j["status"] = gameStatusName(state.status);
    return j;
}

// ─── Sessions ──────────────────────────────────────────────────

json encodeGameState(const GameState& state) {
    json history = json::array();
    for (const auto& record : state.command_history) {
        history.push_back({{"command", encodeCommand(record.command)}, {"message", record.message}});
    }

    json undo = json::array();
    for (const auto& entry : state.undo_stack.entries()) {
        undo.push_back({
            {"graph", encodeGraph(entry.graph)},
            {"files", encodeFiles(entry.files)},
            {"command", commandTypeName(entry.command)},
            {"consecutiveCommits", entry.consecutive_commits},
        });
    }

    return {
        {"puzzleId", state.puzzle_id},
        {"graph", encodeGraph(state.graph)},
        {"files", encodeFiles(state.files)},
        {"commandHistory", std::move(history)},
        {"undoStack", std::move(undo)},
        {"undoCapacity", state.undo_stack.capacity()},
        {"commandsUsed", state.commands_used},
        {"checkoutsUsed", state.checkouts_used},
        {"consecutiveCommits", state.consecutive_commits},
        {"status", gameStatusName(state.status)},
        {"startedAt", state.started_at},
        {"completedAt", state.completed_at},
    };
}

GameState decodeGameState(const json& j) {
    GameState state;
    state.puzzle_id = field<std::string>(j, "puzzleId");
    state.graph = decodeGraph(member(j, "graph"));
    state.files = decodeFiles(arrayField(j, "files"));

    for (const auto& record : arrayField(j, "commandHistory")) {
        state.command_history.push_back(
            {decodeCommand(member(record, "command")), fieldOr<std::string>(record, "message", "")});
    }

    state.undo_stack = UndoStack(fieldOr<size_t>(j, "undoCapacity", 0));
    for (const auto& e : arrayField(j, "undoStack")) {
        UndoEntry entry;
        entry.graph = decodeGraph(member(e, "graph"));
        entry.files = decodeFiles(arrayField(e, "files"));
        entry.command = decodeCommandType(member(e, "command"));
        entry.consecutive_commits = fieldOr<int>(e, "consecutiveCommits", 0);
        state.undo_stack.push(std::move(entry));
    }

    state.commands_used = field<int>(j, "commandsUsed");
    state.checkouts_used = field<int>(j, "checkoutsUsed");
    state.consecutive_commits = fieldOr<int>(j, "consecutiveCommits", 0);
    auto status = parseGameStatus(field<std::string>(j, "status"));
    if (!status) throw DecodeError("Unknown game status for " + state.puzzle_id);
    state.status = *status;
    state.started_at = fieldOr<int64_t>(j, "startedAt", 0);
    state.completed_at = fieldOr<int64_t>(j, "completedAt", 0);
    return state;
}

json parseJson(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw DecodeError("Malformed JSON document");
    }
    return parsed;
}

} // namespace gitty
