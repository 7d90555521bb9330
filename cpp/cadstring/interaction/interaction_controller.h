#pragma once

#include "cadstring/interaction/interaction_types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

class EditEngine;
class CoordinateProjector;

// Translates pointer, keyboard and numeric-field input into EditEngine
// operations for one edit session.
//
// The controller attaches to the engine on construction and detaches on
// destruction, after it saves or cancels the session, or on detach().
// A detached controller ignores all input.
//
// A drag interrupted by another edit, a mode change or detaching is
// committed first, so it is undone on its own.
class InteractionController {
public:
    explicit InteractionController(EditEngine& engine, const CoordinateProjector* projector = nullptr);
    ~InteractionController();

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    // ==============================================================================
    // Lifecycle / mode
    // ==============================================================================
    bool isAttached() const noexcept { return engine_ != nullptr; }
    void detach();

    // Mode and focus are owned by the surrounding panel.
    void setMode(InteractionMode mode);
    InteractionMode getMode() const noexcept { return mode_; }
    bool isEditing() const noexcept { return mode_ == InteractionMode::Editing; }
    void setFocused(bool focused) noexcept { focused_ = focused; }
    bool hasFocus() const noexcept { return focused_; }

    void setProjector(const CoordinateProjector* projector) noexcept { projector_ = projector; }

    // ==============================================================================
    // Pointer
    // ==============================================================================
    // Each handler returns true when the event was consumed.
    bool handlePointerDown(std::size_t vertexIndex, PointerButton button, std::uint32_t modifiers = 0);
    // World position under the pointer; the dragged vertex keeps its Z.
    bool handlePointerMove(double worldX, double worldY);
    bool handlePointerUp();
    bool isDragging() const noexcept { return dragging_; }
    const DragStats& getDragStats() const noexcept { return dragStats_; }

    // ==============================================================================
    // Context menu
    // ==============================================================================
    bool handleContextMenu(std::size_t vertexIndex);
    bool chooseMenuAction(VertexMenuAction action);
    void closeMenu() noexcept { menuVertex_.reset(); }
    std::optional<std::size_t> getMenuVertex() const noexcept { return menuVertex_; }

    // ==============================================================================
    // Keyboard / numeric fields
    // ==============================================================================
    bool handleKeyDown(Key key, std::uint32_t modifiers = 0);

    // Coordinate field bound to the selected vertex: live update per keystroke,
    // commit on blur.
    bool setSelectedCoordinate(Axis axis, double value);
    bool commitCoordinateEdit();

    // ==============================================================================
    // View data
    // ==============================================================================
    std::vector<VertexHandle> getVertexHandles() const;
    std::optional<std::size_t> pickVertex(float screenX, float screenY) const;
    std::optional<std::size_t> pickVertex(float screenX, float screenY, float tolerancePx) const;

    // Recomputed lazily whenever the engine reports a change.
    const EditStats& getStats() const;

private:
    bool acceptsInput() const;
    bool acceptsKeys() const { return acceptsInput() && focused_; }
    ScreenPoint project(const Vertex& v) const;
    void endDrag();
    bool nudgeSelected(double dx, double dy, bool large);
    void finishSession(bool save);

    EditEngine* engine_ = nullptr;
    const CoordinateProjector* projector_ = nullptr;

    InteractionMode mode_ = InteractionMode::Editing;
    bool focused_ = true;

    bool dragging_ = false;
    std::size_t dragIndex_ = 0;
    DragStats dragStats_;

    std::optional<std::size_t> menuVertex_;

    mutable EditStats stats_;
    mutable std::uint32_t statsGeneration_ = 0;
    mutable bool statsValid_ = false;
};
