// =============================================================================
// Hierarchical Bound Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hexzset/cell_bounds.hpp"
#include "hexzset/cell_index.hpp"
#include "hexzset/score_codec.hpp"
#include "test_support.hpp"

#include <random>

using namespace hexzset;
using hexzset::testing::make_cell;

class CellBoundsTest : public ::testing::Test {
protected:
    static constexpr CellIndex SF_RES9 = 0x8928308280fffffull;

    std::mt19937 rng{1234};

    // Random leaf nested under `parent`
    CellIndex random_descendant(CellIndex parent) {
        std::uniform_int_distribution<int> digit(0, cell::DIGIT_MAX);
        CellIndex idx = cell::set_resolution(parent, 15);
        for (int r = cell::get_resolution(parent) + 1; r <= 15; ++r) {
            idx = cell::set_digit(idx, r, digit(rng));
        }
        return idx;
    }
};

TEST_F(CellBoundsTest, KnownResolution9Bounds) {
    EXPECT_EQ(min_child(SF_RES9), 0x8f28308280c0000ull);
    EXPECT_EQ(max_child(SF_RES9), 0x8f28308280f6db6ull);
}

TEST_F(CellBoundsTest, BaseCellBounds) {
    const CellIndex base0 = cell::base_cell_index(0);
    EXPECT_EQ(min_child(base0), 0x08F0000000000000ull);
    EXPECT_EQ(max_child(base0), 0x8f01b6db6db6db6ull);
}

TEST_F(CellBoundsTest, LeafIsFixpoint) {
    const CellIndex leaf = 0x8f283082a30e209ull;
    EXPECT_EQ(min_child(leaf), leaf);
    EXPECT_EQ(max_child(leaf), leaf);

    CellBounds b = leaf_bounds(leaf);
    EXPECT_EQ(b.min, leaf);
    EXPECT_EQ(b.max, leaf);
}

TEST_F(CellBoundsTest, BoundsAreLeaves) {
    for (int res = 0; res < 15; ++res) {
        CellIndex idx = parent_at(random_descendant(cell::base_cell_index(45)), res);
        ASSERT_EQ(cell::get_resolution(idx), res);

        CellBounds b = leaf_bounds(idx);
        EXPECT_EQ(cell::get_resolution(b.min), 15);
        EXPECT_EQ(cell::get_resolution(b.max), 15);
        EXPECT_TRUE(cell::is_well_formed(b.min));
        EXPECT_TRUE(cell::is_well_formed(b.max));
    }
}

TEST_F(CellBoundsTest, BoundsAreTight) {
    // min and max are descendants of the cell, not just numeric bounds
    for (int res = 0; res < 15; ++res) {
        CellIndex idx = parent_at(random_descendant(cell::base_cell_index(100)), res);
        EXPECT_EQ(parent_at(min_child(idx), res), idx) << "res " << res;
        EXPECT_EQ(parent_at(max_child(idx), res), idx) << "res " << res;
    }
}

TEST_F(CellBoundsTest, BoundsContainEveryDescendant) {
    for (int res = 0; res < 15; ++res) {
        CellIndex idx = parent_at(random_descendant(cell::base_cell_index(20)), res);
        const Score lo = ScoreCodec::encode(min_child(idx));
        const Score hi = ScoreCodec::encode(max_child(idx));
        ASSERT_LE(lo, hi);

        for (int i = 0; i < 200; ++i) {
            CellIndex d = random_descendant(idx);
            ASSERT_EQ(parent_at(d, res), idx);
            const Score s = ScoreCodec::encode(d);
            EXPECT_LE(lo, s) << cell::to_string(d) << " under " << cell::to_string(idx);
            EXPECT_LE(s, hi) << cell::to_string(d) << " under " << cell::to_string(idx);
        }
    }
}

TEST_F(CellBoundsTest, SiblingsFallOutside) {
    // Every other child of the parent lies strictly outside the range
    const CellIndex parent = parent_at(SF_RES9, 8);
    const Score lo = ScoreCodec::encode(min_child(SF_RES9));
    const Score hi = ScoreCodec::encode(max_child(SF_RES9));

    for (int digit = 0; digit <= cell::DIGIT_MAX; ++digit) {
        CellIndex sibling = cell::set_resolution(cell::set_digit(parent, 9, digit), 9);
        if (sibling == SF_RES9) continue;
        for (int i = 0; i < 50; ++i) {
            Score s = ScoreCodec::encode(random_descendant(sibling));
            EXPECT_TRUE(s < lo || s > hi) << "digit " << digit;
        }
    }
}

TEST_F(CellBoundsTest, ParentAt) {
    const CellIndex leaf = 0x8f283082a30e209ull;
    EXPECT_EQ(parent_at(leaf, 15), leaf);
    EXPECT_EQ(cell::to_string(parent_at(leaf, 9)), "89283082a33ffff");
    EXPECT_EQ(cell::to_string(parent_at(leaf, 6)), "86283082fffffff");
    EXPECT_EQ(cell::to_string(parent_at(leaf, 0)), "8029fffffffffff");
    // Shares its resolution 6 ancestor with SF_RES9 but not the resolution 9 one
    EXPECT_EQ(parent_at(leaf, 6), parent_at(SF_RES9, 6));
    EXPECT_NE(parent_at(leaf, 9), SF_RES9);
}
