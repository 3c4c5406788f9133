#pragma once

#include "engine/command.hpp"
#include "graph/graph.hpp"
#include "puzzle/file_target.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace gitty {

/// Full copy of the mutable game state taken right before a command ran.
struct UndoEntry {
    Graph graph;
    std::vector<FileTarget> files;
    CommandType command = CommandType::COMMIT;  // the command this entry undoes
    int consecutive_commits = 0;
};

/// Bounded LIFO of snapshots. When full, the oldest snapshot is dropped
/// to make room. A capacity of 0 means unbounded.
class UndoStack {
public:
    explicit UndoStack(size_t capacity = 0) : capacity_(capacity) {}

    void push(UndoEntry entry);

    /// Remove and return the most recent snapshot.
    std::optional<UndoEntry> pop();

    const UndoEntry* peek() const { return entries_.empty() ? nullptr : &entries_.back(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return capacity_; }
    size_t evictedCount() const { return evicted_; }

    /// Oldest first.
    const std::deque<UndoEntry>& entries() const { return entries_; }

    void clear() { entries_.clear(); }

private:
    size_t capacity_;
    size_t evicted_ = 0;
    std::deque<UndoEntry> entries_;
};

} // namespace gitty
