#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gitty {

/// Origin label given to commits created while HEAD is detached.
inline const std::string kDetachedLabel = "(detached)";

/// A node in the commit DAG.
/// Parents are ordered: the first parent is the mainline, a second parent
/// only exists on merge commits.
struct Commit {
    std::string id;
    std::string message;
    std::vector<std::string> parent_ids;
    std::string origin_branch;
    int depth = 0;
    int64_t timestamp = 0;

    Commit() = default;
    Commit(std::string id, std::string message, std::vector<std::string> parents,
           std::string origin_branch, int depth)
        : id(std::move(id)), message(std::move(message)),
          parent_ids(std::move(parents)), origin_branch(std::move(origin_branch)),
          depth(depth) {}

    bool isRoot() const { return parent_ids.empty(); }
    bool isMerge() const { return parent_ids.size() == 2; }

    const std::string& firstParent() const {
        static const std::string none;
        return parent_ids.empty() ? none : parent_ids.front();
    }
};

} // namespace gitty
