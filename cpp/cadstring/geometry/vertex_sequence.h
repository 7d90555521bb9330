#pragma once

#include "cadstring/core/types.h"
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

// Ordered, 0-indexed list of string vertices.
// All edits are const and write the edited copy into `out`; on failure `out`
// is left untouched and the error is returned.
class VertexSequence {
public:
    VertexSequence() = default;
    explicit VertexSequence(std::vector<Vertex> vertices) : vertices_(std::move(vertices)) {}
    VertexSequence(std::initializer_list<Vertex> vertices) : vertices_(vertices) {}

    std::size_t size() const noexcept { return vertices_.size(); }
    bool empty() const noexcept { return vertices_.empty(); }
    const Vertex& operator[](std::size_t index) const { return vertices_[index]; }
    const Vertex& front() const { return vertices_.front(); }
    const Vertex& back() const { return vertices_.back(); }
    const std::vector<Vertex>& vertices() const noexcept { return vertices_; }

    std::vector<Vertex>::const_iterator begin() const noexcept { return vertices_.begin(); }
    std::vector<Vertex>::const_iterator end() const noexcept { return vertices_.end(); }

    // Structural edits
    EditError insertAt(std::size_t index, const Vertex& vertex, VertexSequence& out) const;
    EditError deleteAt(std::size_t index, VertexSequence& out) const;
    EditError replaceAt(std::size_t index, const Vertex& vertex, VertexSequence& out) const;
    VertexSequence reverse() const;

    // Sum of 3-D segment lengths, 0 for fewer than two vertices.
    double pathLength() const noexcept;

    bool operator==(const VertexSequence& other) const { return vertices_ == other.vertices_; }
    bool operator!=(const VertexSequence& other) const { return !(*this == other); }

private:
    std::vector<Vertex> vertices_;
};
