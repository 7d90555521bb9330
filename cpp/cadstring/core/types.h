#ifndef CADSTRING_CORE_TYPES_H
#define CADSTRING_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight value types shared by every layer of the string editor.

// Mine grid coordinates are large, keep them in double precision.
struct Vertex {
    double x;
    double y;
    double z;
};

inline bool operator==(const Vertex& a, const Vertex& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Vertex& a, const Vertex& b) {
    return !(a == b);
}

// Screen-space position of a vertex handle (pixels).
struct ScreenPoint { float x; float y; };

enum class EditError : std::uint32_t {
    Ok = 0,
    InvalidIndex = 1,
    BelowMinimumCardinality = 2,
    AtOldestState = 3,
    AtNewestState = 4,
    InvalidOperation = 5,
};

inline const char* editErrorName(EditError err) {
    switch (err) {
        case EditError::Ok: return "Ok";
        case EditError::InvalidIndex: return "InvalidIndex";
        case EditError::BelowMinimumCardinality: return "BelowMinimumCardinality";
        case EditError::AtOldestState: return "AtOldestState";
        case EditError::AtNewestState: return "AtNewestState";
        case EditError::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

enum class InsertPlacement : std::uint8_t {
    Before = 0,
    After = 1
};

enum class Axis : std::uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

// Tunables a host may change per session.
struct EditOptions {
    std::size_t historyLimit = 0; // 0 = unbounded
    double nudgeStep = 1.0;
    double nudgeStepLarge = 10.0;
    float pickTolerancePx = 8.0f;
};

#endif // CADSTRING_CORE_TYPES_H
