#include "hexzset/cell_bounds.hpp"
#include "hexzset/cell_index.hpp"

namespace hexzset {

namespace {

// Leaf-resolution copy of idx with the undetermined digit groups zeroed
inline CellIndex clear_undetermined(CellIndex idx, int res) noexcept {
    const int child_bits = (cell::MAX_RESOLUTION - res) * cell::DIGIT_BITS;
    CellIndex leaf = cell::set_resolution(idx, cell::MAX_RESOLUTION);
    return (leaf >> child_bits) << child_bits;
}

} // namespace

CellIndex min_child(CellIndex idx) noexcept {
    const int res = cell::get_resolution(idx);
    if (res == cell::MAX_RESOLUTION) {
        return idx;
    }
    return clear_undetermined(idx, res);
}

CellIndex max_child(CellIndex idx) noexcept {
    const int res = cell::get_resolution(idx);
    if (res == cell::MAX_RESOLUTION) {
        return idx;
    }

    CellIndex max = clear_undetermined(idx, res);

    uint64_t child_digits = 0;
    for (int next_res = res + 1; next_res <= cell::MAX_RESOLUTION; ++next_res) {
        child_digits |= uint64_t(cell::DIGIT_MAX) << cell::digit_offset(next_res);
    }
    return max | child_digits;
}

CellBounds leaf_bounds(CellIndex idx) noexcept {
    return CellBounds{min_child(idx), max_child(idx)};
}

CellIndex parent_at(CellIndex idx, int res) noexcept {
    CellIndex parent = cell::set_resolution(idx, res);
    for (int r = res + 1; r <= cell::MAX_RESOLUTION; ++r) {
        parent = cell::set_digit(parent, r, cell::DIGIT_UNUSED);
    }
    return parent;
}

} // namespace hexzset
