#pragma once

#include <string>
#include <utility>

namespace gitty {

/// A named pointer to a commit.
struct Branch {
    std::string name;
    std::string tip_commit_id;

    Branch() = default;
    Branch(std::string name, std::string tip)
        : name(std::move(name)), tip_commit_id(std::move(tip)) {}
};

/// Where HEAD points: attached to a branch, or detached at a raw commit.
struct Head {
    enum class Kind { ATTACHED, DETACHED };

    Kind kind = Kind::ATTACHED;
    std::string ref;  // branch name when attached, commit id when detached

    static Head attached(std::string branch) { return {Kind::ATTACHED, std::move(branch)}; }
    static Head detached(std::string commit) { return {Kind::DETACHED, std::move(commit)}; }

    bool isDetached() const { return kind == Kind::DETACHED; }

    bool operator==(const Head& other) const {
        return kind == other.kind && ref == other.ref;
    }
    bool operator!=(const Head& other) const { return !(*this == other); }
};

} // namespace gitty
