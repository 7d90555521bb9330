#include "cadstring/geometry/vertex_sequence.h"
#include "cadstring/core/edit_constants.h"
#include <cmath>

EditError VertexSequence::insertAt(std::size_t index, const Vertex& vertex, VertexSequence& out) const {
    if (index > vertices_.size()) return EditError::InvalidIndex;

    std::vector<Vertex> next;
    next.reserve(vertices_.size() + 1);
    next.insert(next.end(), vertices_.begin(), vertices_.begin() + static_cast<std::ptrdiff_t>(index));
    next.push_back(vertex);
    next.insert(next.end(), vertices_.begin() + static_cast<std::ptrdiff_t>(index), vertices_.end());
    out.vertices_ = std::move(next);
    return EditError::Ok;
}

EditError VertexSequence::deleteAt(std::size_t index, VertexSequence& out) const {
    if (index >= vertices_.size()) return EditError::InvalidIndex;
    if (vertices_.size() - 1 < edit_constants::MIN_VERTEX_COUNT) return EditError::BelowMinimumCardinality;

    std::vector<Vertex> next;
    next.reserve(vertices_.size() - 1);
    for (std::size_t i = 0; i < vertices_.size(); ++i) {
        if (i != index) next.push_back(vertices_[i]);
    }
    out.vertices_ = std::move(next);
    return EditError::Ok;
}

EditError VertexSequence::replaceAt(std::size_t index, const Vertex& vertex, VertexSequence& out) const {
    if (index >= vertices_.size()) return EditError::InvalidIndex;

    std::vector<Vertex> next = vertices_;
    next[index] = vertex;
    out.vertices_ = std::move(next);
    return EditError::Ok;
}

VertexSequence VertexSequence::reverse() const {
    std::vector<Vertex> next(vertices_.rbegin(), vertices_.rend());
    return VertexSequence(std::move(next));
}

double VertexSequence::pathLength() const noexcept {
    if (vertices_.size() < 2) return 0.0;

    double total = 0.0;
    for (std::size_t i = 1; i < vertices_.size(); ++i) {
        const double dx = vertices_[i].x - vertices_[i - 1].x;
        const double dy = vertices_[i].y - vertices_[i - 1].y;
        const double dz = vertices_[i].z - vertices_[i - 1].z;
        total += std::sqrt(dx * dx + dy * dy + dz * dz);
    }
    return total;
}
