#pragma once

#include "engine/command.hpp"
#include "engine/command_result.hpp"
#include "engine/game_state.hpp"
#include "graph/graph.hpp"
#include "puzzle/puzzle.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace gitty {

/// Objects keep insertion order, so keyed commit records come back in
/// the order they were created.
using json = nlohmann::ordered_json;

/// Malformed or inconsistent serialized data.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// ─── Graph ─────────────────────────────────────────────────────
// {"commits": {id: Commit}, "branches": {name: Branch}, "headRef", "isDetached"}
// Commits are written in insertion order. Decoding accepts them in any
// order as long as every parent is present somewhere in the record.

json encodeGraph(const Graph& graph);
Graph decodeGraph(const json& j);

// ─── Puzzle data ───────────────────────────────────────────────

json encodeFileTarget(const FileTarget& file);
FileTarget decodeFileTarget(const json& j);

json encodeConstraints(const PuzzleConstraints& constraints);
PuzzleConstraints decodeConstraints(const json& j);

json encodePuzzle(const Puzzle& puzzle);
Puzzle decodePuzzle(const json& j);

// ─── Commands ──────────────────────────────────────────────────
// Tagged by "type"; payload field depends on it:
// commit → message, branch → name, checkout → target,
// merge → branch, rebase → onto, undo → none.

json encodeCommand(const Command& command);
Command decodeCommand(const json& j);

json encodeCommandResult(const CommandResult& result);

/// Command result plus the graph and file state a client renders.
json encodeCommandResponse(const CommandResult& result, const GameState& state);

// ─── Sessions ──────────────────────────────────────────────────

json encodeGameState(const GameState& state);
GameState decodeGameState(const json& j);

/// Parse text, throwing DecodeError instead of nlohmann's parse_error.
json parseJson(const std::string& text);

} // namespace gitty
