#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "document_types.hpp"

namespace tumble::editor {

inline constexpr std::size_t kDefaultHistoryCapacity = 50;

// Linear undo/redo over whole-document snapshots.
class HistoryManager {
public:
    explicit HistoryManager(std::size_t capacity = kDefaultHistoryCapacity);

    // Drops any redo branch, appends, and evicts the oldest entry when full.
    void push(DocumentSnapshot snapshot);

    std::optional<DocumentSnapshot> undo();
    std::optional<DocumentSnapshot> redo();

    bool can_undo() const;
    bool can_redo() const;

    const DocumentSnapshot* current() const;
    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    // Index of the current entry; meaningless while empty.
    std::size_t cursor() const { return cursor_; }

    void clear();

private:
    std::vector<DocumentSnapshot> entries_;
    std::size_t cursor_ = 0;
    std::size_t capacity_;
};

}
