#include "cadstring/interaction/interaction_controller.h"
#include "cadstring/interaction/coordinate_projector.h"
#include "cadstring/edit/edit_engine.h"
#include "cadstring/geometry/string_metrics.h"
#include "cadstring/core/logging.h"
#include "cadstring/core/util.h"
#include <cmath>

InteractionController::InteractionController(EditEngine& engine, const CoordinateProjector* projector)
    : engine_(&engine), projector_(projector) {}

InteractionController::~InteractionController() {
    detach();
}

void InteractionController::detach() {
    if (!engine_) return;
    endDrag();
    menuVertex_.reset();
    engine_ = nullptr;
    statsValid_ = false;
}

void InteractionController::setMode(InteractionMode mode) {
    if (mode_ == mode) return;
    mode_ = mode;
    if (mode_ == InteractionMode::Viewing) {
        endDrag();
        menuVertex_.reset();
    }
}

bool InteractionController::acceptsInput() const {
    return engine_ && isEditing() && engine_->isSessionActive();
}

ScreenPoint InteractionController::project(const Vertex& v) const {
    if (projector_) return projector_->worldToScreen(v.x, v.y, v.z);
    return ScreenPoint{static_cast<float>(v.x), static_cast<float>(v.y)};
}

// Ends the gesture and commits any live move, so the working vertices
// never outlive the drag without a history entry.
void InteractionController::endDrag() {
    dragging_ = false;
    if (engine_ && engine_->isSessionActive() && engine_->hasPendingMove()) {
        (void)engine_->commitMove();
    }
}

void InteractionController::finishSession(bool save) {
    // Save hands over the working vertices as they are; cancel drops them.
    dragging_ = false;
    menuVertex_.reset();
    if (save) {
        (void)engine_->save();
    } else {
        (void)engine_->cancel();
    }
    detach();
}

// ==============================================================================
// Pointer
// ==============================================================================

bool InteractionController::handlePointerDown(std::size_t vertexIndex, PointerButton button, std::uint32_t modifiers) {
    (void)modifiers;
    if (!acceptsInput()) return false;

    if (button == PointerButton::Secondary) {
        return handleContextMenu(vertexIndex);
    }

    if (vertexIndex >= engine_->getVertexCount()) return false;
    endDrag();
    if (engine_->selectVertex(vertexIndex) != EditError::Ok) return false;
    menuVertex_.reset();
    dragging_ = true;
    dragIndex_ = vertexIndex;
    dragStats_ = DragStats{};
    return true;
}

bool InteractionController::handlePointerMove(double worldX, double worldY) {
    if (!dragging_ || !acceptsInput()) return false;

    const VertexSequence& vertices = engine_->getVertices();
    if (dragIndex_ >= vertices.size()) {
        dragging_ = false;
        return false;
    }

    const double t0 = emscripten_get_now();
    const double z = vertices[dragIndex_].z;
    const EditError err = engine_->moveVertex(dragIndex_, worldX, worldY, z);
    dragStats_.lastUpdateMs = static_cast<float>(emscripten_get_now() - t0);
    if (err != EditError::Ok) return false;
    dragStats_.updateCount++;
    return true;
}

bool InteractionController::handlePointerUp() {
    if (!dragging_) return false;
    dragging_ = false;
    if (!acceptsInput()) return false;
    // Always commits, even when the pointer never moved.
    (void)engine_->commitMove();
    return true;
}

// ==============================================================================
// Context menu
// ==============================================================================

bool InteractionController::handleContextMenu(std::size_t vertexIndex) {
    if (!acceptsInput()) return false;
    if (vertexIndex >= engine_->getVertexCount()) return false;

    if (menuVertex_ && *menuVertex_ == vertexIndex) {
        menuVertex_.reset();
    } else {
        menuVertex_ = vertexIndex;
    }
    return true;
}

bool InteractionController::chooseMenuAction(VertexMenuAction action) {
    if (!acceptsInput() || !menuVertex_) return false;

    const std::size_t index = *menuVertex_;
    menuVertex_.reset();
    endDrag();

    EditError err = EditError::Ok;
    switch (action) {
        case VertexMenuAction::InsertBefore:
            err = engine_->insertVertex(index, InsertPlacement::Before);
            break;
        case VertexMenuAction::InsertAfter:
            err = engine_->insertVertex(index, InsertPlacement::After);
            break;
        case VertexMenuAction::Delete:
            err = engine_->deleteVertex(index);
            break;
    }
    return err == EditError::Ok;
}

// ==============================================================================
// Keyboard
// ==============================================================================

bool InteractionController::nudgeSelected(double dx, double dy, bool large) {
    const auto selected = engine_->getSelectedVertex();
    if (!selected) return false;
    endDrag();

    const EditOptions& options = engine_->getOptions();
    const double step = large ? options.nudgeStepLarge : options.nudgeStep;
    const Vertex v = engine_->getVertices()[*selected];
    if (engine_->moveVertex(*selected, v.x + dx * step, v.y + dy * step, v.z) != EditError::Ok) {
        return false;
    }
    // Each nudge is its own history entry.
    (void)engine_->commitMove();
    return true;
}

bool InteractionController::handleKeyDown(Key key, std::uint32_t modifiers) {
    if (!acceptsKeys()) return false;

    const bool ctrl = hasModifier(modifiers, KeyModifier::Ctrl);
    const bool shift = hasModifier(modifiers, KeyModifier::Shift);

    switch (key) {
        case Key::Escape:
            CADSTRING_LOG_DEBUG("key: cancel session");
            finishSession(false);
            return true;
        case Key::Enter:
            CADSTRING_LOG_DEBUG("key: save session");
            finishSession(true);
            return true;
        case Key::Delete:
        case Key::Backspace: {
            const auto selected = engine_->getSelectedVertex();
            if (!selected) return false;
            endDrag();
            (void)engine_->deleteVertex(*selected);
            return true;
        }
        case Key::Z:
            if (!ctrl) return false;
            endDrag();
            (void)engine_->undo();
            return true;
        case Key::Y:
            if (!ctrl) return false;
            endDrag();
            (void)engine_->redo();
            return true;
        case Key::ArrowUp:
            return nudgeSelected(0.0, 1.0, shift);
        case Key::ArrowDown:
            return nudgeSelected(0.0, -1.0, shift);
        case Key::ArrowLeft:
            return nudgeSelected(-1.0, 0.0, shift);
        case Key::ArrowRight:
            return nudgeSelected(1.0, 0.0, shift);
        case Key::Other:
            break;
    }
    return false;
}

// ==============================================================================
// Numeric fields
// ==============================================================================

bool InteractionController::setSelectedCoordinate(Axis axis, double value) {
    if (!acceptsInput()) return false;
    const auto selected = engine_->getSelectedVertex();
    if (!selected) return false;

    Vertex v = engine_->getVertices()[*selected];
    switch (axis) {
        case Axis::X: v.x = value; break;
        case Axis::Y: v.y = value; break;
        case Axis::Z: v.z = value; break;
    }
    return engine_->moveVertex(*selected, v.x, v.y, v.z) == EditError::Ok;
}

bool InteractionController::commitCoordinateEdit() {
    if (!acceptsInput()) return false;
    return engine_->commitMove() == EditError::Ok;
}

// ==============================================================================
// View data
// ==============================================================================

std::vector<VertexHandle> InteractionController::getVertexHandles() const {
    std::vector<VertexHandle> handles;
    if (!engine_ || !engine_->isSessionActive()) return handles;

    const VertexSequence& vertices = engine_->getVertices();
    const auto selected = engine_->getSelectedVertex();
    handles.reserve(vertices.size());
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        VertexHandle h{};
        h.index = i;
        h.world = vertices[i];
        h.screen = project(vertices[i]);
        h.selected = selected && *selected == i;
        h.first = i == 0;
        h.last = i + 1 == vertices.size();
        h.menuOpen = menuVertex_ && *menuVertex_ == i;
        handles.push_back(h);
    }
    return handles;
}

std::optional<std::size_t> InteractionController::pickVertex(float screenX, float screenY) const {
    if (!engine_) return std::nullopt;
    return pickVertex(screenX, screenY, engine_->getOptions().pickTolerancePx);
}

std::optional<std::size_t> InteractionController::pickVertex(float screenX, float screenY, float tolerancePx) const {
    if (!engine_ || !engine_->isSessionActive()) return std::nullopt;

    const VertexSequence& vertices = engine_->getVertices();
    std::optional<std::size_t> best;
    float bestDistSq = tolerancePx * tolerancePx;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        const ScreenPoint p = project(vertices[i]);
        const float dx = p.x - screenX;
        const float dy = p.y - screenY;
        const float distSq = dx * dx + dy * dy;
        // Strict compare keeps the lowest index on ties.
        if (distSq < bestDistSq || (!best && distSq <= bestDistSq)) {
            best = i;
            bestDistSq = distSq;
        }
    }
    return best;
}

const EditStats& InteractionController::getStats() const {
    if (!engine_) {
        stats_ = EditStats{};
        statsValid_ = false;
        return stats_;
    }
    if (statsValid_ && statsGeneration_ == engine_->getGeneration()) return stats_;

    const VertexSequence& vertices = engine_->getVertices();
    const EditHistory& history = engine_->getHistory();
    stats_.vertexCount = vertices.size();
    stats_.pathLength = vertices.pathLength();
    const bool closed = engine_->isClosed();
    stats_.planLength = string_metrics::planLength(vertices, closed);
    stats_.ringLength = string_metrics::ringLength(vertices, closed);
    const auto area = string_metrics::planArea(vertices, closed);
    stats_.hasArea = area.has_value();
    stats_.planArea = area.value_or(0.0);
    const auto grade = string_metrics::gradient(vertices);
    stats_.minGradient = grade ? grade->minGradient : 0.0;
    stats_.maxGradient = grade ? grade->maxGradient : 0.0;
    stats_.avgGradient = grade ? grade->avgGradient : 0.0;
    stats_.canUndo = engine_->canUndo();
    stats_.canRedo = engine_->canRedo();
    stats_.historySize = history.getHistorySize();
    stats_.historyCursor = history.getCursor();
    statsGeneration_ = engine_->getGeneration();
    statsValid_ = true;
    return stats_;
}
