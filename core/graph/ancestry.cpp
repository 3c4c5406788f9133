#include "graph/ancestry.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace gitty {

bool isAncestor(const Graph& graph, const std::string& ancestor_id,
                const std::string& descendant_id) {
    std::unordered_set<std::string> visited;
    std::deque<std::string> queue{descendant_id};

    while (!queue.empty()) {
        std::string current = std::move(queue.front());
        queue.pop_front();
        if (current == ancestor_id) return true;
        if (!visited.insert(current).second) continue;

        const Commit* c = graph.getCommit(current);
        if (!c) continue;
        for (const auto& pid : c->parent_ids) {
            queue.push_back(pid);
        }
    }
    return false;
}

std::unordered_set<std::string> ancestorsOf(const Graph& graph, const std::string& commit_id) {
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack{commit_id};

    while (!stack.empty()) {
        std::string current = std::move(stack.back());
        stack.pop_back();
        const Commit* c = graph.getCommit(current);
        if (!c || !visited.insert(current).second) continue;
        for (const auto& pid : c->parent_ids) {
            stack.push_back(pid);
        }
    }
    return visited;
}

std::set<Position> positionsInHistory(const Graph& graph, const std::string& commit_id) {
    std::set<Position> positions;
    for (const auto& id : ancestorsOf(graph, commit_id)) {
        const Commit* c = graph.getCommit(id);
        positions.emplace(c->origin_branch, c->depth);
    }
    return positions;
}

std::vector<std::string> commitsToReplay(const Graph& graph, const std::string& from_tip,
                                         const std::string& onto_tip) {
    std::vector<std::string> commits;
    const Commit* current = graph.getCommit(from_tip);
    while (current && current->id != onto_tip) {
        commits.push_back(current->id);
        if (current->isRoot()) break;
        current = graph.getCommit(current->firstParent());
    }

    std::reverse(commits.begin(), commits.end());
    return commits;
}

std::vector<std::string> replayCommits(Graph& graph, const std::vector<std::string>& commits,
                                       const std::string& onto, const std::string& origin_branch,
                                       int64_t timestamp) {
    std::vector<std::string> replayed;
    replayed.reserve(commits.size());

    std::string parent = onto;
    for (const auto& id : commits) {
        const Commit* original = graph.getCommit(id);
        if (!original) {
            throw std::runtime_error("Cannot replay missing commit: " + id);
        }
        parent = graph.addCommit(original->message, {parent}, origin_branch, timestamp);
        replayed.push_back(parent);
    }
    return replayed;
}

} // namespace gitty
