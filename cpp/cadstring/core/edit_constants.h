#pragma once

#include <cstddef>

/**
 * @file edit_constants.h
 * @brief Fixed behavioural constants of the string editor.
 *
 * The web client mirrors these values; changing one changes what users see
 * when they insert or nudge vertices.
 */

namespace edit_constants {

// =============================================================================
// Topology
// =============================================================================

/// A string with fewer vertices than this is not editable.
constexpr std::size_t MIN_VERTEX_COUNT = 2;

// =============================================================================
// Boundary insertion
// =============================================================================

/// Offset applied to the end vertex when inserting past either end of the
/// string (there is only one neighbour to work from).
constexpr double BOUNDARY_INSERT_DX = 10.0;
constexpr double BOUNDARY_INSERT_DY = 10.0;
constexpr double BOUNDARY_INSERT_DZ = 0.0;

// =============================================================================
// Gradient
// =============================================================================

/// Segments with a shorter plan run report a gradient of zero.
constexpr double MIN_GRADIENT_RUN = 0.001;

} // namespace edit_constants
