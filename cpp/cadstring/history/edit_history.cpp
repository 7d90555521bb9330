#include "cadstring/history/edit_history.h"
#include "cadstring/core/logging.h"
#include <utility>

EditHistory::EditHistory(VertexSequence initial, std::size_t limit)
    : limit_(limit) {
    entries_.push_back(std::move(initial));
}

void EditHistory::commit(VertexSequence sequence) {
    if (cursor_ + 1 < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1), entries_.end());
    }
    entries_.push_back(std::move(sequence));
    cursor_ = entries_.size() - 1;
    evictOverflow();
    generation_++;
}

EditError EditHistory::undo(VertexSequence& out) {
    if (!canUndo()) return EditError::AtOldestState;
    cursor_--;
    out = entries_[cursor_];
    generation_++;
    return EditError::Ok;
}

EditError EditHistory::redo(VertexSequence& out) {
    if (!canRedo()) return EditError::AtNewestState;
    cursor_++;
    out = entries_[cursor_];
    generation_++;
    return EditError::Ok;
}

void EditHistory::reset(VertexSequence initial) {
    entries_.clear();
    entries_.push_back(std::move(initial));
    cursor_ = 0;
    generation_++;
}

void EditHistory::setLimit(std::size_t limit) {
    limit_ = limit;
    if (limit_ > 0 && entries_.size() > limit_) {
        evictOverflow();
        generation_++;
    }
}

void EditHistory::evictOverflow() {
    if (limit_ == 0 || entries_.size() <= limit_) return;

    // The cursor entry must survive, so never evict past it.
    std::size_t excess = entries_.size() - limit_;
    if (excess > cursor_) excess = cursor_;
    if (excess == 0) return;

    entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
    cursor_ -= excess;
    CADSTRING_LOG_DEBUG("history: evicted %zu oldest entries (limit %zu)", excess, limit_);
}
