#include "engine/undo_stack.hpp"

namespace gitty {

void UndoStack::push(UndoEntry entry) {
    if (capacity_ > 0 && entries_.size() >= capacity_) {
        entries_.pop_front();
        evicted_++;
    }
    entries_.push_back(std::move(entry));
}

std::optional<UndoEntry> UndoStack::pop() {
    if (entries_.empty()) return std::nullopt;
    UndoEntry entry = std::move(entries_.back());
    entries_.pop_back();
    return entry;
}

} // namespace gitty
