#pragma once

#include "hexzset/types.hpp"

namespace hexzset {

// Smallest and largest resolution 15 descendant of a cell
struct CellBounds {
    CellIndex min = 0;
    CellIndex max = 0;
};

/**
 * Resolution 15 descendant of `idx` with every undetermined digit set to 0.
 * Returns `idx` unchanged when it is already a leaf.
 */
CellIndex min_child(CellIndex idx) noexcept;

/**
 * Resolution 15 descendant of `idx` with every undetermined digit set to 6.
 * Returns `idx` unchanged when it is already a leaf.
 */
CellIndex max_child(CellIndex idx) noexcept;

CellBounds leaf_bounds(CellIndex idx) noexcept;

/**
 * Ancestor of `idx` at resolution `res` (res <= resolution of idx):
 * resolution field set to `res`, digits below it reset to the unused sentinel.
 */
CellIndex parent_at(CellIndex idx, int res) noexcept;

} // namespace hexzset
