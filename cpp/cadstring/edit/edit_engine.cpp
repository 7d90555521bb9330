#include "cadstring/edit/edit_engine.h"
#include "cadstring/edit/edit_session_host.h"
#include "cadstring/core/edit_constants.h"
#include "cadstring/core/logging.h"
#include <utility>

EditEngine::EditEngine() : EditEngine(EditOptions{}) {}

EditEngine::EditEngine(const EditOptions& options)
    : options_(options), history_(VertexSequence{}, options.historyLimit) {}

void EditEngine::setOptions(const EditOptions& options) {
    options_ = options;
    history_.setLimit(options_.historyLimit);
    generation_++;
}

EditError EditEngine::finish(EditError err, const char* op) {
    lastError_ = err;
    if (err != EditError::Ok) {
        CADSTRING_LOG_DEBUG("%s rejected: %s", op, editErrorName(err));
    }
    return err;
}

// ==============================================================================
// Session lifecycle
// ==============================================================================

EditError EditEngine::loadString(const CADString& string) {
    if (active_ && string.stringId == string_.stringId) {
        string_.name = string.name;
        string_.type = string.type;
        string_.isClosed = string.isClosed;
        generation_++;
        return finish(EditError::Ok, "loadString");
    }

    if (string.vertices.size() < edit_constants::MIN_VERTEX_COUNT) {
        return finish(EditError::BelowMinimumCardinality, "loadString");
    }

    string_.stringId = string.stringId;
    string_.name = string.name;
    string_.type = string.type;
    string_.isClosed = string.isClosed;
    working_ = string.vertices;
    history_.reset(working_);
    selected_.reset();
    dirty_ = false;
    active_ = true;
    generation_++;
    CADSTRING_LOG_DEBUG("session started for '%s' (%zu vertices)", string_.name.c_str(), working_.size());
    return finish(EditError::Ok, "loadString");
}

void EditEngine::endSession() {
    active_ = false;
    dirty_ = false;
    selected_.reset();
    working_ = VertexSequence{};
    history_.reset(VertexSequence{});
    string_ = CADString{};
    generation_++;
}

EditError EditEngine::save() {
    if (!active_) return finish(EditError::InvalidOperation, "save");

    VertexSequence result = std::move(working_);
    CADSTRING_LOG_DEBUG("session saved for '%s' (%zu vertices)", string_.name.c_str(), result.size());
    endSession();
    if (host_) host_->save(std::move(result));
    return finish(EditError::Ok, "save");
}

EditError EditEngine::cancel() {
    if (!active_) return finish(EditError::InvalidOperation, "cancel");

    CADSTRING_LOG_DEBUG("session cancelled for '%s'", string_.name.c_str());
    endSession();
    if (host_) host_->cancel();
    return finish(EditError::Ok, "cancel");
}

// ==============================================================================
// Vertex edits
// ==============================================================================

Vertex EditEngine::computeInsertedVertex(std::size_t index, InsertPlacement placement) const {
    const bool before = placement == InsertPlacement::Before;
    const std::size_t count = working_.size();

    // Neighbours on either side of the insertion point.
    const bool hasPrev = before ? index > 0 : true;
    const std::size_t prevIndex = before ? index - 1 : index;
    const std::size_t nextIndex = before ? index : index + 1;
    const bool hasNext = nextIndex < count;

    if (hasPrev && hasNext) {
        const Vertex& prev = working_[prevIndex];
        const Vertex& next = working_[nextIndex];
        return Vertex{
            (prev.x + next.x) / 2.0,
            (prev.y + next.y) / 2.0,
            (prev.z + next.z) / 2.0,
        };
    }

    const Vertex& ref = working_[index];
    return Vertex{
        ref.x + edit_constants::BOUNDARY_INSERT_DX,
        ref.y + edit_constants::BOUNDARY_INSERT_DY,
        ref.z + edit_constants::BOUNDARY_INSERT_DZ,
    };
}

EditError EditEngine::insertVertex(std::size_t index, InsertPlacement placement) {
    if (!active_) return finish(EditError::InvalidOperation, "insertVertex");
    if (working_.size() < edit_constants::MIN_VERTEX_COUNT) {
        return finish(EditError::BelowMinimumCardinality, "insertVertex");
    }
    if (index >= working_.size()) return finish(EditError::InvalidIndex, "insertVertex");

    const Vertex vertex = computeInsertedVertex(index, placement);
    const std::size_t at = placement == InsertPlacement::Before ? index : index + 1;

    VertexSequence next;
    const EditError err = working_.insertAt(at, vertex, next);
    if (err != EditError::Ok) return finish(err, "insertVertex");

    working_ = std::move(next);
    history_.commit(working_);
    dirty_ = false;
    generation_++;
    if (host_) host_->vertexInserted(at, vertex);
    return finish(EditError::Ok, "insertVertex");
}

EditError EditEngine::deleteVertex(std::size_t index) {
    if (!active_) return finish(EditError::InvalidOperation, "deleteVertex");

    VertexSequence next;
    const EditError err = working_.deleteAt(index, next);
    if (err != EditError::Ok) return finish(err, "deleteVertex");

    working_ = std::move(next);
    history_.commit(working_);
    dirty_ = false;
    selected_.reset();
    generation_++;
    if (host_) host_->vertexDeleted(index);
    return finish(EditError::Ok, "deleteVertex");
}

EditError EditEngine::moveVertex(std::size_t index, double x, double y, double z) {
    if (!active_) return finish(EditError::InvalidOperation, "moveVertex");

    VertexSequence next;
    const EditError err = working_.replaceAt(index, Vertex{x, y, z}, next);
    if (err != EditError::Ok) return finish(err, "moveVertex");

    working_ = std::move(next);
    dirty_ = true;
    generation_++;
    if (host_) host_->vertexMoved(index, x, y, z);
    return finish(EditError::Ok, "moveVertex");
}

EditError EditEngine::commitMove() {
    if (!active_) return finish(EditError::InvalidOperation, "commitMove");

    history_.commit(working_);
    dirty_ = false;
    generation_++;
    return finish(EditError::Ok, "commitMove");
}

EditError EditEngine::reverse() {
    if (!active_) return finish(EditError::InvalidOperation, "reverse");
    if (host_) host_->reverse();
    return finish(EditError::Ok, "reverse");
}

EditError EditEngine::toggleOpenClosed() {
    if (!active_) return finish(EditError::InvalidOperation, "toggleOpenClosed");
    if (host_) {
        if (string_.isClosed) {
            host_->open();
        } else {
            host_->close();
        }
    }
    return finish(EditError::Ok, "toggleOpenClosed");
}

void EditEngine::clampSelection() {
    if (selected_ && *selected_ >= working_.size()) selected_.reset();
}

EditError EditEngine::undo() {
    if (!active_) return finish(EditError::InvalidOperation, "undo");

    VertexSequence restored;
    const EditError err = history_.undo(restored);
    if (err != EditError::Ok) return finish(err, "undo");

    working_ = std::move(restored);
    dirty_ = false;
    clampSelection();
    generation_++;
    return finish(EditError::Ok, "undo");
}

EditError EditEngine::redo() {
    if (!active_) return finish(EditError::InvalidOperation, "redo");

    VertexSequence restored;
    const EditError err = history_.redo(restored);
    if (err != EditError::Ok) return finish(err, "redo");

    working_ = std::move(restored);
    dirty_ = false;
    clampSelection();
    generation_++;
    return finish(EditError::Ok, "redo");
}

// ==============================================================================
// Selection
// ==============================================================================

EditError EditEngine::selectVertex(std::optional<std::size_t> index) {
    if (!active_) return finish(EditError::InvalidOperation, "selectVertex");
    if (index && *index >= working_.size()) return finish(EditError::InvalidIndex, "selectVertex");
    if (selected_ != index) {
        selected_ = index;
        generation_++;
    }
    return finish(EditError::Ok, "selectVertex");
}

void EditEngine::clearSelection() {
    if (!selected_) return;
    selected_.reset();
    generation_++;
}
