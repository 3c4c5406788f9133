#pragma once

#include <string>

namespace gitty {

/// A file to collect, placed at (branch, depth). Collected once a commit
/// lands exactly on that position; never uncollected afterwards.
struct FileTarget {
    std::string id;
    std::string name;
    std::string branch;
    int depth = 0;
    bool collected = false;

    bool operator==(const FileTarget& other) const {
        return id == other.id && name == other.name && branch == other.branch &&
               depth == other.depth && collected == other.collected;
    }
};

} // namespace gitty
