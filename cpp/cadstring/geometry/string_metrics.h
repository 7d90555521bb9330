#pragma once

#include "cadstring/geometry/vertex_sequence.h"
#include <optional>
#include <vector>

// Read-only geometry figures shown next to a string while it is edited.

struct GradientInfo {
    double minGradient = 0.0;  // percent
    double maxGradient = 0.0;
    double avgGradient = 0.0;
    std::vector<double> segmentGradients;
};

namespace string_metrics {

// XY-only polyline length, plus the closing segment of a closed string.
double planLength(const VertexSequence& seq, bool closed = false) noexcept;

// 3-D length including the closing segment of a closed string.
double ringLength(const VertexSequence& seq, bool closed) noexcept;

// Shoelace plan area. Only defined for closed strings of 3+ vertices.
std::optional<double> planArea(const VertexSequence& seq, bool closed);

std::optional<GradientInfo> gradient(const VertexSequence& seq);

} // namespace string_metrics
