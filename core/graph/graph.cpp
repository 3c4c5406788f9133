#include "graph/graph.hpp"
#include "graph/ancestry.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gitty {

namespace {

// Bijective on 32 bits, so distinct sequence numbers give distinct ids.
uint32_t mixSequence(uint32_t x) {
    x ^= x >> 16;
    x *= 0x7feb352dU;
    x ^= x >> 15;
    x *= 0x846ca68bU;
    x ^= x >> 16;
    return x;
}

} // namespace

Graph Graph::withRoot(const std::string& trunk, const std::string& message) {
    Graph g;
    std::string root = g.addCommit(message, {}, trunk);
    g.addBranch(trunk, root);
    g.setHead(Head::attached(trunk));
    return g;
}

// ─── Commit operations ─────────────────────────────────────────

std::string Graph::nextCommitId() {
    std::string id;
    do {
        std::ostringstream oss;
        oss << std::hex << std::setw(8) << std::setfill('0') << mixSequence(next_commit_seq_++);
        id = oss.str();
    } while (commits_.count(id));
    return id;
}

void Graph::checkParents(const std::vector<std::string>& parent_ids) const {
    if (parent_ids.size() > 2) {
        throw std::runtime_error("Commit cannot have more than two parents");
    }
    if (parent_ids.empty() && !commits_.empty()) {
        throw std::runtime_error("Graph already has a root commit");
    }
    for (const auto& pid : parent_ids) {
        if (!commits_.count(pid)) {
            throw std::runtime_error("Parent commit not found: " + pid);
        }
    }
}

std::string Graph::addCommit(const std::string& message,
                             const std::vector<std::string>& parent_ids,
                             const std::string& origin_branch,
                             int64_t timestamp) {
    checkParents(parent_ids);

    int depth = 0;
    for (const auto& pid : parent_ids) {
        depth = std::max(depth, commits_.at(pid).depth + 1);
    }

    std::string id = nextCommitId();
    Commit commit(id, message, parent_ids, origin_branch, depth);
    commit.timestamp = timestamp;
    commits_.emplace(id, std::move(commit));
    commit_order_.push_back(id);
    return id;
}

void Graph::insertCommit(const Commit& commit) {
    if (commit.id.empty()) {
        throw std::runtime_error("Commit id must not be empty");
    }
    if (commits_.count(commit.id)) {
        throw std::runtime_error("Commit ID already exists: " + commit.id);
    }
    checkParents(commit.parent_ids);

    int expected = 0;
    for (const auto& pid : commit.parent_ids) {
        expected = std::max(expected, commits_.at(pid).depth + 1);
    }
    if (commit.depth != expected) {
        throw std::runtime_error("Commit " + commit.id + " has depth " +
                                 std::to_string(commit.depth) + ", expected " +
                                 std::to_string(expected));
    }

    commits_.emplace(commit.id, commit);
    commit_order_.push_back(commit.id);
}

const Commit* Graph::getCommit(const std::string& id) const {
    auto it = commits_.find(id);
    return it != commits_.end() ? &it->second : nullptr;
}

const Commit* Graph::findByPrefix(const std::string& prefix) const {
    if (prefix.empty()) return nullptr;
    for (const auto& id : commit_order_) {
        if (id.compare(0, prefix.size(), prefix) == 0) {
            return &commits_.at(id);
        }
    }
    return nullptr;
}

// ─── Branch operations ─────────────────────────────────────────

void Graph::addBranch(const std::string& name, const std::string& tip_commit_id) {
    if (branches_.count(name)) {
        throw std::runtime_error("Branch already exists: " + name);
    }
    if (!commits_.count(tip_commit_id)) {
        throw std::runtime_error("Branch tip not found: " + tip_commit_id);
    }
    branches_.emplace(name, Branch(name, tip_commit_id));
}

void Graph::moveBranchTip(const std::string& name, const std::string& tip_commit_id) {
    auto it = branches_.find(name);
    if (it == branches_.end()) {
        throw std::runtime_error("Branch not found: " + name);
    }
    if (!commits_.count(tip_commit_id)) {
        throw std::runtime_error("Branch tip not found: " + tip_commit_id);
    }
    it->second.tip_commit_id = tip_commit_id;
}

const Branch* Graph::getBranch(const std::string& name) const {
    auto it = branches_.find(name);
    return it != branches_.end() ? &it->second : nullptr;
}

// ─── HEAD ──────────────────────────────────────────────────────

void Graph::setHead(const Head& head) {
    if (head.isDetached()) {
        if (!commits_.count(head.ref)) {
            throw std::runtime_error("Detached HEAD target not found: " + head.ref);
        }
    } else if (!branches_.count(head.ref)) {
        throw std::runtime_error("HEAD branch not found: " + head.ref);
    }
    head_ = head;
}

const Commit* Graph::currentCommit() const {
    if (head_.isDetached()) {
        return getCommit(head_.ref);
    }
    const Branch* b = getBranch(head_.ref);
    return b ? getCommit(b->tip_commit_id) : nullptr;
}

const Branch* Graph::currentBranch() const {
    if (head_.isDetached()) return nullptr;
    return getBranch(head_.ref);
}

bool Graph::isAncestor(const std::string& ancestor_id, const std::string& descendant_id) const {
    return gitty::isAncestor(*this, ancestor_id, descendant_id);
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachCommit(const std::function<void(const Commit&)>& fn) const {
    for (const auto& id : commit_order_) {
        fn(commits_.at(id));
    }
}

bool Graph::operator==(const Graph& other) const {
    if (head_ != other.head_ || commit_order_ != other.commit_order_) return false;
    if (branches_.size() != other.branches_.size()) return false;
    for (const auto& [name, branch] : branches_) {
        const Branch* ob = other.getBranch(name);
        if (!ob || ob->tip_commit_id != branch.tip_commit_id) return false;
    }
    for (const auto& [id, commit] : commits_) {
        const Commit* oc = other.getCommit(id);
        if (!oc || oc->parent_ids != commit.parent_ids || oc->depth != commit.depth ||
            oc->origin_branch != commit.origin_branch || oc->message != commit.message) {
            return false;
        }
    }
    return true;
}

} // namespace gitty
