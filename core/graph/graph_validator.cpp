#include "graph/graph_validator.hpp"

#include <algorithm>

namespace gitty {

std::vector<ValidationIssue> GraphValidator::check(const Graph& graph) const {
    std::vector<ValidationIssue> results;
    int roots = 0;

    graph.forEachCommit([&](const Commit& commit) {
        if (commit.isRoot()) {
            roots++;
            if (commit.depth != 0) {
                results.push_back({false, "root_depth",
                    "Root commit " + commit.id + " has depth " + std::to_string(commit.depth),
                    commit.id});
            }
            return;
        }

        if (commit.parent_ids.size() > 2) {
            results.push_back({false, "parent_count",
                "Commit " + commit.id + " has " + std::to_string(commit.parent_ids.size()) +
                " parents", commit.id});
        }

        int expected = 0;
        bool parents_ok = true;
        for (const auto& pid : commit.parent_ids) {
            const Commit* parent = graph.getCommit(pid);
            if (!parent) {
                results.push_back({false, "parent_exists",
                    "Commit " + commit.id + " has missing parent " + pid, commit.id});
                parents_ok = false;
                continue;
            }
            expected = std::max(expected, parent->depth + 1);
        }

        if (parents_ok && commit.depth != expected) {
            results.push_back({false, "depth_rule",
                "Commit " + commit.id + " has depth " + std::to_string(commit.depth) +
                ", expected " + std::to_string(expected), commit.id});
        }
    });

    if (roots != 1) {
        results.push_back({false, "single_root",
            "Graph has " + std::to_string(roots) + " root commits", ""});
    }

    for (const auto& [name, branch] : graph.branches()) {
        if (!graph.hasCommit(branch.tip_commit_id)) {
            results.push_back({false, "branch_tip_exists",
                "Branch " + name + " points at missing commit " + branch.tip_commit_id, ""});
        }
    }

    const Head& head = graph.head();
    if (head.isDetached() ? !graph.hasCommit(head.ref) : !graph.hasBranch(head.ref)) {
        results.push_back({false, "head_resolves",
            "HEAD reference " + head.ref + " does not resolve", ""});
    }

    if (results.empty()) {
        results.push_back({true, "graph_check", "All graph checks passed", ""});
    }

    return results;
}

bool GraphValidator::isValid(const Graph& graph) const {
    auto results = check(graph);
    return std::all_of(results.begin(), results.end(),
                       [](const ValidationIssue& r) { return r.passed; });
}

} // namespace gitty
