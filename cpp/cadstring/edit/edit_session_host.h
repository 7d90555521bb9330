#pragma once

#include "cadstring/core/types.h"
#include "cadstring/geometry/vertex_sequence.h"
#include <cstddef>

// Host side of an edit session: the persistence path plus optional
// observers mirroring each change (e.g. into a live network session).
// Observers default to no-ops; save/cancel must be implemented.
class EditSessionHost {
public:
    virtual ~EditSessionHost() = default;

    // Ownership of the final vertices passes to the host.
    virtual void save(VertexSequence vertices) = 0;
    virtual void cancel() = 0;

    virtual void vertexInserted(std::size_t index, const Vertex& vertex) { (void)index; (void)vertex; }
    virtual void vertexDeleted(std::size_t index) { (void)index; }
    virtual void vertexMoved(std::size_t index, double x, double y, double z) { (void)index; (void)x; (void)y; (void)z; }

    // Structural metadata. The engine neither retains nor validates the result.
    virtual void reverse() {}
    virtual void open() {}
    virtual void close() {}
};
