#pragma once

#include "cadstring/core/types.h"
#include <cstddef>
#include <cstdint>

enum class InteractionMode : std::uint8_t {
    Viewing = 0,
    Editing = 1
};

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Secondary = 2
};

// Bitmask, same bit layout the web host sends for pointer and key events.
enum class KeyModifier : std::uint32_t {
    None = 0,
    Shift = 1 << 0,
    Ctrl = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3
};

inline bool hasModifier(std::uint32_t modifiers, KeyModifier m) {
    return (modifiers & static_cast<std::uint32_t>(m)) != 0;
}

enum class Key : std::uint8_t {
    Other = 0,
    Escape,
    Enter,
    Delete,
    Backspace,
    ArrowUp,
    ArrowDown,
    ArrowLeft,
    ArrowRight,
    Z,
    Y
};

enum class VertexMenuAction : std::uint8_t {
    InsertBefore = 0,
    InsertAfter = 1,
    Delete = 2
};

// One draggable handle as laid out for the host view.
struct VertexHandle {
    std::size_t index;
    Vertex world;
    ScreenPoint screen;
    bool selected;
    bool first;
    bool last;
    bool menuOpen;
};

struct EditStats {
    std::size_t vertexCount = 0;
    double pathLength = 0.0;
    double planLength = 0.0;  // closing segment included for closed strings
    double ringLength = 0.0;
    bool hasArea = false;
    double planArea = 0.0;
    double minGradient = 0.0;  // percent
    double maxGradient = 0.0;
    double avgGradient = 0.0;
    bool canUndo = false;
    bool canRedo = false;
    std::size_t historySize = 0;
    std::size_t historyCursor = 0;
};

// Live-move bookkeeping for the current drag gesture.
struct DragStats {
    std::uint32_t updateCount = 0;
    float lastUpdateMs = 0.0f;
};
