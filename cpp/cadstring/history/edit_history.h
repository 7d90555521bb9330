#pragma once

#include "cadstring/geometry/vertex_sequence.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// Linear undo/redo stack of whole-sequence snapshots.
// entries_[cursor_] is always the last committed state; entries past the
// cursor form the redo branch and are dropped by the next commit.
class EditHistory {
public:
    explicit EditHistory(VertexSequence initial = {}, std::size_t limit = 0);

    bool canUndo() const noexcept { return cursor_ > 0; }
    bool canRedo() const noexcept { return cursor_ + 1 < entries_.size(); }

    void commit(VertexSequence sequence);
    EditError undo(VertexSequence& out);
    EditError redo(VertexSequence& out);

    // Drops every entry and starts again from `initial`.
    void reset(VertexSequence initial);

    // 0 = unbounded. Shrinking evicts the oldest entries immediately.
    void setLimit(std::size_t limit);
    std::size_t getLimit() const noexcept { return limit_; }

    const VertexSequence& current() const { return entries_[cursor_]; }
    const VertexSequence& entryAt(std::size_t index) const { return entries_[index]; }
    std::size_t getHistorySize() const noexcept { return entries_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }

private:
    void evictOverflow();

    std::vector<VertexSequence> entries_;
    std::size_t cursor_ = 0;
    std::size_t limit_ = 0;
    std::uint32_t generation_ = 0;
};
