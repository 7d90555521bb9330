#include "cadstring/geometry/string_metrics.h"
#include "cadstring/core/edit_constants.h"
#include <algorithm>
#include <cmath>

namespace {
inline double planDistance(const Vertex& a, const Vertex& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}
} // namespace

namespace string_metrics {

double planLength(const VertexSequence& seq, bool closed) noexcept {
    double total = 0.0;
    for (std::size_t i = 1; i < seq.size(); ++i) {
        total += planDistance(seq[i - 1], seq[i]);
    }
    if (closed && seq.size() > 2) {
        total += planDistance(seq.back(), seq.front());
    }
    return total;
}

double ringLength(const VertexSequence& seq, bool closed) noexcept {
    double total = seq.pathLength();
    if (closed && seq.size() > 2) {
        const Vertex& a = seq.back();
        const Vertex& b = seq.front();
        const double dx = b.x - a.x;
        const double dy = b.y - a.y;
        const double dz = b.z - a.z;
        total += std::sqrt(dx * dx + dy * dy + dz * dz);
    }
    return total;
}

std::optional<double> planArea(const VertexSequence& seq, bool closed) {
    if (!closed || seq.size() < 3) return std::nullopt;

    const std::size_t n = seq.size();
    double twiceArea = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Vertex& a = seq[i];
        const Vertex& b = seq[(i + 1) % n];
        twiceArea += a.x * b.y - b.x * a.y;
    }
    return std::fabs(twiceArea) / 2.0;
}

std::optional<GradientInfo> gradient(const VertexSequence& seq) {
    if (seq.size() < 2) return std::nullopt;

    GradientInfo info;
    info.segmentGradients.reserve(seq.size() - 1);
    for (std::size_t i = 1; i < seq.size(); ++i) {
        const double run = planDistance(seq[i - 1], seq[i]);
        const double rise = seq[i].z - seq[i - 1].z;
        const double g = run > edit_constants::MIN_GRADIENT_RUN ? (rise / run) * 100.0 : 0.0;
        info.segmentGradients.push_back(g);
    }

    const auto [minIt, maxIt] = std::minmax_element(info.segmentGradients.begin(), info.segmentGradients.end());
    info.minGradient = *minIt;
    info.maxGradient = *maxIt;
    double sum = 0.0;
    for (const double g : info.segmentGradients) sum += g;
    info.avgGradient = sum / static_cast<double>(info.segmentGradients.size());
    return info;
}

} // namespace string_metrics
