#include "engine/command_executor.hpp"
#include "graph/ancestry.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <chrono>

namespace gitty {

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string shortId(const std::string& id) {
    return id.substr(0, 7);
}

} // namespace

std::vector<FileTarget> collectFilesAt(std::vector<FileTarget>& files,
                                       const std::string& branch, int depth) {
    std::vector<FileTarget> collected;
    for (auto& file : files) {
        if (!file.collected && file.branch == branch && file.depth == depth) {
            file.collected = true;
            collected.push_back(file);
        }
    }
    return collected;
}

GameState CommandExecutor::newGame() const {
    GameState state;
    state.puzzle_id = puzzle_.id;
    state.graph = puzzle_.initial_graph;
    state.files = puzzle_.files;
    for (auto& file : state.files) {
        file.collected = false;
    }
    state.undo_stack = UndoStack(static_cast<size_t>(std::max(0, puzzle_.constraints.max_commands)));
    state.started_at = recording_ ? nowMillis() : 0;
    return state;
}

// ─── Dispatch ──────────────────────────────────────────────────

CommandResult CommandExecutor::execute(GameState& state, const Command& command) const {
    if (command.type == CommandType::UNDO) {
        return undo(state);
    }

    if (auto rejected = checkQuotas(state, command)) {
        gitty_log("Rejected " + toString(command) + ": " + rejected->message, "Executor");
        return *rejected;
    }

    UndoEntry snapshot;
    if (recording_) {
        snapshot.graph = state.graph;
        snapshot.files = state.files;
        snapshot.command = command.type;
        snapshot.consecutive_commits = state.consecutive_commits;
    }

    CommandResult result;
    switch (command.type) {
        case CommandType::COMMIT:
            result = commit(state, command.argument);
            break;
        case CommandType::BRANCH:
            result = createBranch(state, command.argument);
            break;
        case CommandType::CHECKOUT:
            result = checkout(state, command.argument);
            break;
        case CommandType::MERGE:
            result = merge(state, command.argument);
            break;
        case CommandType::REBASE:
            result = rebase(state, command.argument);
            break;
        case CommandType::UNDO:
            break;
    }

    if (!result.success) {
        gitty_log("Rejected " + toString(command) + ": " + result.message, "Executor");
        return result;
    }

    state.commands_used++;
    if (command.type == CommandType::CHECKOUT) state.checkouts_used++;
    state.consecutive_commits =
        command.type == CommandType::COMMIT ? state.consecutive_commits + 1 : 0;

    if (recording_) {
        state.undo_stack.push(std::move(snapshot));
        state.command_history.push_back({command, result.message});
    }

    if (result.game_won) {
        state.status = GameStatus::WON;
        state.completed_at = recording_ ? nowMillis() : 0;
        gitty_log("Puzzle " + puzzle_.id + " won in " + std::to_string(state.commands_used) +
                  " commands", "Executor");
    }
    return result;
}

std::optional<CommandResult> CommandExecutor::checkQuotas(const GameState& state,
                                                          const Command& command) const {
    const PuzzleConstraints& c = puzzle_.constraints;

    if (state.status != GameStatus::IN_PROGRESS) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Game has ended");
    }
    if (!c.allows(command.type)) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Command '" + commandTypeName(command.type) + "' is not allowed in this puzzle");
    }
    if (state.commands_used >= c.max_commands) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Maximum commands (" + std::to_string(c.max_commands) +
            ") reached. Use undo or restart.");
    }
    if (command.type == CommandType::CHECKOUT && state.checkouts_used >= c.max_checkouts) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Maximum checkouts (" + std::to_string(c.max_checkouts) + ") reached");
    }
    return std::nullopt;
}

// ─── Commands ──────────────────────────────────────────────────

CommandResult CommandExecutor::commit(GameState& state, const std::string& message) const {
    const PuzzleConstraints& c = puzzle_.constraints;
    Graph& graph = state.graph;

    const Commit* current = graph.currentCommit();
    if (!current) {
        return CommandResult::fail(ErrorKind::STATE, "No current commit found");
    }
    if (static_cast<int>(graph.commitCount()) >= c.max_commits) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Maximum commits (" + std::to_string(c.max_commits) + ") reached");
    }
    if (c.max_consecutive_commits > 0 && state.consecutive_commits >= c.max_consecutive_commits) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Maximum consecutive commits (" + std::to_string(c.max_consecutive_commits) +
            ") reached");
    }

    const Branch* branch = graph.currentBranch();
    const std::string label = branch ? branch->name : kDetachedLabel;
    const std::string text = message.empty() ? "Commit" : message;

    std::string id = graph.addCommit(text, {current->id}, label, recording_ ? nowMillis() : 0);
    if (branch) {
        graph.moveBranchTip(label, id);
    } else {
        graph.setHead(Head::detached(id));
    }

    const int depth = graph.getCommit(id)->depth;
    CommandResult result = CommandResult::ok("Created commit " + shortId(id) + ": " + text);
    result.files_collected = collectFilesAt(state.files, label, depth);
    result.game_won = branch != nullptr && isWinning(state, label);
    return result;
}

CommandResult CommandExecutor::createBranch(GameState& state, const std::string& name) const {
    Graph& graph = state.graph;

    if (name.empty()) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Branch name is required");
    }
    if (!puzzle_.declaresBranch(name)) {
        return CommandResult::fail(ErrorKind::REFERENCE,
            "Branch '" + name + "' is not available in this puzzle");
    }
    if (graph.hasBranch(name)) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Branch '" + name + "' already exists");
    }
    if (static_cast<int>(graph.branchCount()) >= puzzle_.constraints.max_branches) {
        return CommandResult::fail(ErrorKind::VALIDATION,
            "Maximum branches (" + std::to_string(puzzle_.constraints.max_branches) + ") reached");
    }
    const Commit* current = graph.currentCommit();
    if (!current) {
        return CommandResult::fail(ErrorKind::STATE, "No current commit found");
    }

    graph.addBranch(name, current->id);
    return CommandResult::ok("Created branch '" + name + "'");
}

CommandResult CommandExecutor::checkout(GameState& state, const std::string& target) const {
    Graph& graph = state.graph;

    if (target.empty()) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Checkout target is required");
    }

    if (const Branch* branch = graph.getBranch(target)) {
        const Commit* tip = graph.getCommit(branch->tip_commit_id);
        graph.setHead(Head::attached(target));
        std::string message = "Switched to branch '" + target + "'";
        if (tip) {
            message += "\n  -> HEAD at " + shortId(tip->id) + ": \"" + tip->message + "\"";
        }
        return CommandResult::ok(message);
    }

    const Commit* commit = graph.getCommit(target);
    if (!commit) commit = graph.findByPrefix(target);
    if (!commit) {
        return CommandResult::fail(ErrorKind::REFERENCE,
            "pathspec '" + target + "' did not match any branch or commit");
    }

    graph.setHead(Head::detached(commit->id));
    return CommandResult::ok("HEAD is now at " + shortId(commit->id));
}

CommandResult CommandExecutor::merge(GameState& state, const std::string& branch_name) const {
    Graph& graph = state.graph;

    if (branch_name.empty()) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Branch name is required");
    }
    const Branch* current = graph.currentBranch();
    if (!current) {
        return CommandResult::fail(ErrorKind::STATE, "Cannot merge in detached HEAD state");
    }
    const Branch* target = graph.getBranch(branch_name);
    if (!target) {
        return CommandResult::fail(ErrorKind::REFERENCE, "Branch '" + branch_name + "' not found");
    }

    const std::string current_name = current->name;
    const std::string current_tip = current->tip_commit_id;
    const std::string target_tip = target->tip_commit_id;

    if (graph.isAncestor(current_tip, target_tip)) {
        graph.moveBranchTip(current_name, target_tip);
        CommandResult result = CommandResult::ok(
            "Fast-forward merge: " + current_name + " -> " + branch_name);
        result.game_won = isWinning(state, current_name);
        return result;
    }

    std::string merge_id = graph.addCommit(
        "Merge branch '" + branch_name + "' into " + current_name,
        {current_tip, target_tip}, current_name, recording_ ? nowMillis() : 0);
    graph.moveBranchTip(current_name, merge_id);

    CommandResult result = CommandResult::ok(
        "Merged '" + branch_name + "' into '" + current_name + "'");
    result.files_collected =
        collectFilesAt(state.files, current_name, graph.getCommit(merge_id)->depth);
    result.game_won = isWinning(state, current_name);
    return result;
}

CommandResult CommandExecutor::rebase(GameState& state, const std::string& onto) const {
    Graph& graph = state.graph;

    if (onto.empty()) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Target branch is required");
    }
    const Branch* current = graph.currentBranch();
    if (!current) {
        return CommandResult::fail(ErrorKind::STATE, "Cannot rebase in detached HEAD state");
    }
    const Branch* target = graph.getBranch(onto);
    if (!target) {
        return CommandResult::fail(ErrorKind::REFERENCE, "Branch '" + onto + "' not found");
    }

    const std::string current_name = current->name;
    const std::string onto_tip = target->tip_commit_id;
    auto pending = commitsToReplay(graph, current->tip_commit_id, onto_tip);

    if (pending.empty()) {
        CommandResult result = CommandResult::ok("Already up to date");
        result.game_won = isWinning(state, current_name);
        return result;
    }

    auto replayed = replayCommits(graph, pending, onto_tip, current_name,
                                  recording_ ? nowMillis() : 0);
    graph.moveBranchTip(current_name, replayed.back());

    CommandResult result = CommandResult::ok(
        "Rebased '" + current_name + "' onto '" + onto + "' (" +
        std::to_string(replayed.size()) + " commits replayed)");
    for (const auto& id : replayed) {
        auto collected = collectFilesAt(state.files, current_name, graph.getCommit(id)->depth);
        result.files_collected.insert(result.files_collected.end(),
                                      collected.begin(), collected.end());
    }
    result.game_won = isWinning(state, current_name);
    return result;
}

// ─── Win predicate ─────────────────────────────────────────────

// Stricter than "all files collected on a trunk move": every file position
// must also be in the trunk's history, so a file collected on a side branch
// counts only once that work reaches the trunk. This is intentional.
bool CommandExecutor::isWinning(const GameState& state, const std::string& advanced_branch) const {
    if (advanced_branch != puzzle_.trunk || !state.allFilesCollected()) return false;

    const Branch* trunk = state.graph.getBranch(puzzle_.trunk);
    if (!trunk) return false;

    const auto history = positionsInHistory(state.graph, trunk->tip_commit_id);
    return std::all_of(state.files.begin(), state.files.end(), [&](const FileTarget& f) {
        return history.count({f.branch, f.depth}) > 0;
    });
}

// ─── Undo ──────────────────────────────────────────────────────

CommandResult CommandExecutor::undo(GameState& state) const {
    if (state.status != GameStatus::IN_PROGRESS) {
        return CommandResult::fail(ErrorKind::VALIDATION, "Game has ended");
    }
    if (!puzzle_.constraints.allows(CommandType::UNDO)) {
        return CommandResult::fail(ErrorKind::VALIDATION,
                                   "Command 'undo' is not allowed in this puzzle");
    }

    auto entry = state.undo_stack.pop();
    if (!entry) {
        return CommandResult::fail(ErrorKind::STATE, "Nothing to undo");
    }

    state.graph = std::move(entry->graph);
    state.files = std::move(entry->files);
    state.commands_used = std::max(0, state.commands_used - 1);
    if (entry->command == CommandType::CHECKOUT) {
        state.checkouts_used = std::max(0, state.checkouts_used - 1);
    }
    state.consecutive_commits = entry->consecutive_commits;
    if (!state.command_history.empty()) {
        state.command_history.pop_back();
    }
    return CommandResult::ok("Undid last " + commandTypeName(entry->command));
}

// ─── Session entry points ──────────────────────────────────────

GameState startGame(const Puzzle& puzzle) {
    return CommandExecutor(puzzle).newGame();
}

CommandResult applyCommand(const Puzzle& puzzle, GameState& state, const Command& command) {
    return CommandExecutor(puzzle).execute(state, command);
}

bool undo(const Puzzle& puzzle, GameState& state) {
    return CommandExecutor(puzzle).undo(state).success;
}

} // namespace gitty
