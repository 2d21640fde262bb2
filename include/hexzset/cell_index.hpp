#pragma once

#include <string>

#include "hexzset/types.hpp"

namespace hexzset {

class CellIndexer;

/**
 * Bit layout of a hierarchical cell index, most-significant first:
 *
 *   |1|   4|  3|   4|      7| 15 x 3
 *    0 0001 000 rrrr bbbbbbb d1 d2 ... d15
 *
 * reserved bit, mode (1 = cell), reserved bits, resolution 0-15,
 * base cell 0-121, one 3-bit digit (0-6) per resolution level. Digits past
 * the resolution hold the sentinel 7.
 *
 * All accessors work on the raw integer; nothing here goes through the
 * geospatial library's richer index type.
 */
namespace cell {

constexpr int MIN_RESOLUTION = 0;
constexpr int MAX_RESOLUTION = 15;
constexpr int NUM_BASE_CELLS = 122;

constexpr int MODE_CELL = 1;

constexpr int DIGIT_BITS = 3;
constexpr uint64_t DIGIT_MASK = 7;
constexpr int DIGIT_MAX = 6;
constexpr int DIGIT_UNUSED = 7;

constexpr int BASE_CELL_OFFSET = 45;
constexpr uint64_t BASE_CELL_MASK = uint64_t(127) << BASE_CELL_OFFSET;

constexpr int RES_OFFSET = 52;
constexpr uint64_t RES_MASK = uint64_t(15) << RES_OFFSET;

constexpr int RESERVED_OFFSET = 56;
constexpr uint64_t RESERVED_MASK = uint64_t(7) << RESERVED_OFFSET;

constexpr int MODE_OFFSET = 59;
constexpr uint64_t MODE_MASK = uint64_t(15) << MODE_OFFSET;

constexpr int HIGH_BIT_OFFSET = 63;
constexpr uint64_t HIGH_BIT_MASK = uint64_t(1) << HIGH_BIT_OFFSET;

// Length of the canonical hex rendering of a cell index
constexpr size_t KEY_LENGTH = 15;

constexpr int get_resolution(CellIndex idx) noexcept {
    return static_cast<int>((idx & RES_MASK) >> RES_OFFSET);
}

constexpr CellIndex set_resolution(CellIndex idx, int res) noexcept {
    return (idx & ~RES_MASK) | (static_cast<uint64_t>(res) << RES_OFFSET);
}

constexpr int get_mode(CellIndex idx) noexcept {
    return static_cast<int>((idx & MODE_MASK) >> MODE_OFFSET);
}

constexpr CellIndex set_mode(CellIndex idx, int mode) noexcept {
    return (idx & ~MODE_MASK) | (static_cast<uint64_t>(mode) << MODE_OFFSET);
}

constexpr int get_base_cell(CellIndex idx) noexcept {
    return static_cast<int>((idx & BASE_CELL_MASK) >> BASE_CELL_OFFSET);
}

constexpr CellIndex set_base_cell(CellIndex idx, int base_cell) noexcept {
    return (idx & ~BASE_CELL_MASK) | (static_cast<uint64_t>(base_cell) << BASE_CELL_OFFSET);
}

// Bit offset of the digit group for resolution level `res` (1..15)
constexpr int digit_offset(int res) noexcept {
    return (MAX_RESOLUTION - res) * DIGIT_BITS;
}

constexpr int get_digit(CellIndex idx, int res) noexcept {
    return static_cast<int>((idx >> digit_offset(res)) & DIGIT_MASK);
}

constexpr CellIndex set_digit(CellIndex idx, int res, int digit) noexcept {
    return (idx & ~(DIGIT_MASK << digit_offset(res))) |
           (static_cast<uint64_t>(digit) << digit_offset(res));
}

/**
 * Index with mode 1, the given base cell and resolution 0, all digit groups
 * set to the unused sentinel. Starting point for building cells digit by
 * digit with set_resolution/set_digit.
 */
constexpr CellIndex base_cell_index(int base_cell) noexcept {
    return set_base_cell(set_mode(uint64_t(0x1FFFFFFFFFFF), MODE_CELL), base_cell);
}

/**
 * Structural check of the bit layout: high bit and reserved bits clear,
 * mode 1, base cell in range, digits 0-6 up to the resolution and 7 after.
 * This does not reject the deleted subsequences of pentagon base cells;
 * that is CellIndexer::is_valid's job.
 */
bool is_well_formed(CellIndex idx) noexcept;

// Lowercase hex rendering without leading zeros ("8f283082a30e209")
std::string to_string(CellIndex idx);

// Decimal rendering of the raw integer
std::string to_decimal_string(CellIndex idx);

} // namespace cell

/**
 * Parse a caller-supplied cell reference.
 *
 * A token matching ^(0x)?[0-9A-Za-z]{15}$ is read as the canonical hex key,
 * anything else as a decimal integer. The result must be accepted by
 * indexer.is_valid().
 *
 * @throws InvalidIndexStringError on any parse or validation failure
 */
CellIndex parse_index_string(const std::string& text, const CellIndexer& indexer);

} // namespace hexzset
