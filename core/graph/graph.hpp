#pragma once

#include "graph/commit.hpp"
#include "graph/branch.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitty {

// ─── Graph ─────────────────────────────────────────────────────
// The commit DAG plus branch pointers and HEAD.
// Commits are keyed by id and also kept in insertion order, which is
// the order used when resolving short id prefixes. Branches are kept
// sorted by name. A commit may only name existing commits as parents,
// so the graph is acyclic by construction.

class Graph {
public:
    Graph() = default;

    /// Graph holding a single root commit with `trunk` attached to it.
    static Graph withRoot(const std::string& trunk,
                          const std::string& message = "Initial commit");

    // ── Commit operations ──
    /// Create a commit with a generated id. Depth is derived from the
    /// parents (0 for the root). Throws if a parent is missing or a
    /// second root is attempted.
    std::string addCommit(const std::string& message,
                          const std::vector<std::string>& parent_ids,
                          const std::string& origin_branch,
                          int64_t timestamp = 0);
    /// Insert a fully specified commit (deserialization). Validates the
    /// same invariants as addCommit, including the depth rule.
    void insertCommit(const Commit& commit);
    const Commit* getCommit(const std::string& id) const;
    bool hasCommit(const std::string& id) const { return commits_.count(id) > 0; }
    const std::vector<std::string>& commitIds() const { return commit_order_; }
    size_t commitCount() const { return commits_.size(); }
    /// First commit, in insertion order, whose id starts with `prefix`.
    const Commit* findByPrefix(const std::string& prefix) const;

    // ── Branch operations ──
    void addBranch(const std::string& name, const std::string& tip_commit_id);
    void moveBranchTip(const std::string& name, const std::string& tip_commit_id);
    const Branch* getBranch(const std::string& name) const;
    bool hasBranch(const std::string& name) const { return branches_.count(name) > 0; }
    const std::map<std::string, Branch>& branches() const { return branches_; }
    size_t branchCount() const { return branches_.size(); }

    // ── HEAD ──
    void setHead(const Head& head);
    const Head& head() const { return head_; }

    /// Commit HEAD resolves to, or nullptr when it cannot be resolved.
    const Commit* currentCommit() const;
    /// Branch HEAD is attached to, or nullptr when detached.
    const Branch* currentBranch() const;

    // ── Ancestry ──
    bool isAncestor(const std::string& ancestor_id, const std::string& descendant_id) const;

    // ── Iteration ──
    void forEachCommit(const std::function<void(const Commit&)>& fn) const;

    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    std::string nextCommitId();
    void checkParents(const std::vector<std::string>& parent_ids) const;

    uint32_t next_commit_seq_ = 1;

    std::unordered_map<std::string, Commit> commits_;
    std::vector<std::string> commit_order_;
    std::map<std::string, Branch> branches_;
    Head head_;
};

} // namespace gitty
