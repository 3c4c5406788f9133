#pragma once

#include "graph/graph.hpp"

#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gitty {

/// (origin branch, depth) coordinate of a commit.
using Position = std::pair<std::string, int>;

/// True if `ancestor_id` is reachable from `descendant_id` over any
/// parent edge. A commit is its own ancestor.
bool isAncestor(const Graph& graph, const std::string& ancestor_id,
                const std::string& descendant_id);

/// All commits reachable from `commit_id`, the commit itself included.
std::unordered_set<std::string> ancestorsOf(const Graph& graph, const std::string& commit_id);

/// Positions of every commit in the history of `commit_id`.
std::set<Position> positionsInHistory(const Graph& graph, const std::string& commit_id);

/// Commits to move when rebasing `from_tip` onto `onto_tip`, oldest first.
/// Walks first parents back from `from_tip` until it reaches `onto_tip`
/// itself. If `onto_tip` is not on that chain, the walk runs through the
/// root and the whole chain is replayed. Empty when the tips are equal.
std::vector<std::string> commitsToReplay(const Graph& graph, const std::string& from_tip,
                                         const std::string& onto_tip);

/// Recreate `commits` in order on top of `onto`, labelled `origin_branch`.
/// Returns the new commit ids; the originals are left in place.
std::vector<std::string> replayCommits(Graph& graph, const std::vector<std::string>& commits,
                                       const std::string& onto, const std::string& origin_branch,
                                       int64_t timestamp = 0);

} // namespace gitty
