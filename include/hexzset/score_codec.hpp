#pragma once

#include "hexzset/types.hpp"

namespace hexzset {

/**
 * Lossless, order-preserving mapping between a leaf cell index and the
 * double score stored in the ordered member store.
 *
 * A leaf cell always has reserved bits 0, mode 1 and resolution 15, so the
 * top 12 bits carry no information and only the low 52 bits are stored.
 * 52 bits fit exactly in a double mantissa, which makes the conversion exact.
 *
 * This is the only place that knows about the fixed header. Changing how
 * cells of other resolutions are stored means replacing this class.
 */
class ScoreCodec {
public:
    // Clears the top 12 bits (reserved + mode + reserved + resolution)
    static constexpr uint64_t LOW52_MASK = 0x000FFFFFFFFFFFFFull;

    // mode = 1, resolution = 15, restored on decode
    static constexpr uint64_t HIGH12_BITS = 0x08F0000000000000ull;

    /**
     * Leaf cell index to score. Callers guarantee `leaf` is a valid
     * resolution 15 cell; masking never fails.
     */
    static constexpr Score encode(CellIndex leaf) noexcept {
        return static_cast<Score>(leaf & LOW52_MASK);
    }

    // Exclusive upper bound of every encoded score (2^52)
    static constexpr Score SCORE_LIMIT = 4503599627370496.0;

    // True for finite, non-negative scores below 2^52: the only doubles
    // decode() accepts. NaN fails every comparison and is rejected too.
    static constexpr bool in_range(Score score) noexcept {
        return score >= 0.0 && score < SCORE_LIMIT;
    }

    /**
     * Score to leaf cell index. Requires in_range(score). In-range scores
     * that did not come from encode() still produce a value; whether it
     * names a real cell is for CellIndexer to say.
     */
    static constexpr CellIndex decode(Score score) noexcept {
        return static_cast<uint64_t>(score) | HIGH12_BITS;
    }
};

} // namespace hexzset
