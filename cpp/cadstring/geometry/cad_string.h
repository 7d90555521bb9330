#pragma once

#include "cadstring/geometry/vertex_sequence.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Mining linework categories. Keys match the backend's string_type column.
enum class StringType : std::uint8_t {
    PitBoundary = 0,
    BenchCrest,
    BenchToe,
    HaulRoad,
    Ramp,
    Contour,
    DrillPattern,
    SurveyTraverse,
    PowerLine,
    WaterLine,
    FenceLine,
    GeologicalContact,
    Fault,
    Boundary,
    Custom,
};

constexpr std::size_t kStringTypeCount = static_cast<std::size_t>(StringType::Custom) + 1;

const char* stringTypeKey(StringType type);
const char* stringTypeLabel(StringType type);
// Unknown keys map to Custom.
StringType parseStringType(std::string_view key);

// Backend-owned string as handed to the editor at session start.
struct CADString {
    std::string stringId;
    std::string name;
    StringType type = StringType::Boundary;
    bool isClosed = false;
    VertexSequence vertices;
};
