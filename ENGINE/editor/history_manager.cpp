#include "history_manager.hpp"

#include <algorithm>
#include <utility>

namespace tumble::editor {

HistoryManager::HistoryManager(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void HistoryManager::push(DocumentSnapshot snapshot) {
    if (!entries_.empty()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_) + 1, entries_.end());
    }
    entries_.push_back(std::move(snapshot));
    if (entries_.size() > capacity_) {
        entries_.erase(entries_.begin());
    }
    cursor_ = entries_.size() - 1;
}

std::optional<DocumentSnapshot> HistoryManager::undo() {
    if (!can_undo()) {
        return std::nullopt;
    }
    --cursor_;
    return entries_[cursor_];
}

std::optional<DocumentSnapshot> HistoryManager::redo() {
    if (!can_redo()) {
        return std::nullopt;
    }
    ++cursor_;
    return entries_[cursor_];
}

bool HistoryManager::can_undo() const {
    return !entries_.empty() && cursor_ > 0;
}

bool HistoryManager::can_redo() const {
    return !entries_.empty() && cursor_ + 1 < entries_.size();
}

const DocumentSnapshot* HistoryManager::current() const {
    if (entries_.empty()) {
        return nullptr;
    }
    return &entries_[cursor_];
}

void HistoryManager::clear() {
    entries_.clear();
    cursor_ = 0;
}

}
