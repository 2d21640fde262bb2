// =============================================================================
// Spatial Range Query Engine Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hexzset/range_query.hpp"
#include "hexzset/cell_bounds.hpp"
#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"
#include "hexzset/geo_set.hpp"
#include "hexzset/score_codec.hpp"
#include "hexzset/store/memory_store.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>

using namespace hexzset;
using hexzset::testing::CountingStore;
using hexzset::testing::LayoutIndexer;
using hexzset::testing::extend_to_leaf;
using hexzset::testing::make_cell;

class RangeQueryTest : public ::testing::Test {
protected:
    static constexpr CellIndex SF_RES9 = 0x8928308280fffffull;

    MemoryMemberStore memory;
    CountingStore store{memory};
    LayoutIndexer indexer;
    SpatialRangeQueryEngine engine{store, indexer};

    // Inside SF_RES9: lowest, highest and one in between
    const CellIndex in_low = extend_to_leaf(SF_RES9, {0, 0, 0, 0, 0, 0});
    const CellIndex in_mid = extend_to_leaf(SF_RES9, {3, 1, 4, 1, 5, 2});
    const CellIndex in_high = extend_to_leaf(SF_RES9, {6, 6, 6, 6, 6, 6});
    // Neighbouring resolution 9 cell and an unrelated leaf
    const CellIndex out_sibling = extend_to_leaf(make_cell(20, {0, 6, 0, 4, 0, 5, 0, 0, 4}), {0, 0, 0, 0, 0, 0});
    const CellIndex out_far = 0x8f283082a30e209ull;

    void SetUp() override {
        memory.insert("places", {
            {"high", ScoreCodec::encode(in_high)},
            {"low", ScoreCodec::encode(in_low)},
            {"mid", ScoreCodec::encode(in_mid)},
            {"sibling", ScoreCodec::encode(out_sibling)},
            {"far", ScoreCodec::encode(out_far)},
        });
    }

    static std::vector<std::string> names(const std::vector<ContainedEntry>& entries) {
        std::vector<std::string> out;
        for (const auto& e : entries) out.push_back(e.name);
        return out;
    }
};

// =============================================================================
// Bounds
// =============================================================================

TEST_F(RangeQueryTest, BoundsMatchLeafBounds) {
    ScoreBounds b = SpatialRangeQueryEngine::bounds_for(SF_RES9);
    EXPECT_EQ(b.min, ScoreCodec::encode(0x8f28308280c0000ull));
    EXPECT_EQ(b.max, ScoreCodec::encode(0x8f28308280f6db6ull));
}

TEST_F(RangeQueryTest, BoundsOfLeafAreDegenerate) {
    ScoreBounds b = SpatialRangeQueryEngine::bounds_for(in_mid);
    EXPECT_EQ(b.min, b.max);
    EXPECT_EQ(b.min, ScoreCodec::encode(in_mid));
}

// =============================================================================
// Containment
// =============================================================================

TEST_F(RangeQueryTest, ContainedNamesInScoreOrder) {
    auto entries = engine.contained_entries("places", SF_RES9, false);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"low", "mid", "high"}));
    for (const auto& e : entries) {
        EXPECT_FALSE(e.index.has_value());
    }

    EXPECT_EQ(store.range_queries, 1);
    EXPECT_EQ(store.last_min, ScoreCodec::encode(min_child(SF_RES9)));
    EXPECT_EQ(store.last_max, ScoreCodec::encode(max_child(SF_RES9)));
}

TEST_F(RangeQueryTest, ContainedWithIndices) {
    auto entries = engine.contained_entries("places", SF_RES9, true);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].index, cell::to_string(in_low));
    EXPECT_EQ(entries[1].index, cell::to_string(in_mid));
    EXPECT_EQ(entries[2].index, cell::to_string(in_high));
}

TEST_F(RangeQueryTest, ContainedWithLimit) {
    auto entries = engine.contained_entries("places", SF_RES9, false, RangeLimit{1, 1});
    EXPECT_EQ(names(entries), (std::vector<std::string>{"mid"}));
}

TEST_F(RangeQueryTest, CoarserCellContainsMore) {
    // Resolution 8 parent holds SF_RES9 and its sibling
    auto entries = engine.contained_entries("places", parent_at(SF_RES9, 8), false);
    EXPECT_EQ(entries.size(), 4u);
    EXPECT_EQ(engine.count_contained("places", parent_at(SF_RES9, 6)), 5u);
}

TEST_F(RangeQueryTest, LeafContainsItself) {
    auto entries = engine.contained_entries("places", in_mid, true);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "mid");
    EXPECT_EQ(entries[0].index, cell::to_string(in_mid));
}

TEST_F(RangeQueryTest, EmptyKeyOrCell) {
    EXPECT_TRUE(engine.contained_entries("nothing", SF_RES9, true).empty());
    EXPECT_TRUE(engine.contained_entries("places", cell::base_cell_index(0), false).empty());
}

TEST_F(RangeQueryTest, CountMatchesContainment) {
    for (CellIndex c : {SF_RES9, parent_at(SF_RES9, 8), parent_at(SF_RES9, 3), in_low, cell::base_cell_index(7)}) {
        EXPECT_EQ(engine.count_contained("places", c),
                  engine.contained_entries("places", c, false).size()) << cell::to_string(c);
    }
    EXPECT_GT(store.count_queries, 0);
}

// =============================================================================
// Removal
// =============================================================================

TEST_F(RangeQueryTest, RemoveContained) {
    EXPECT_EQ(engine.remove_contained("places", SF_RES9), 3u);
    EXPECT_EQ(store.removes, 1);
    EXPECT_EQ(memory.size("places"), 2u);
    EXPECT_TRUE(memory.score_of("places", "sibling").has_value());
    EXPECT_TRUE(memory.score_of("places", "far").has_value());
    EXPECT_EQ(engine.count_contained("places", SF_RES9), 0u);
}

TEST_F(RangeQueryTest, RemoveFromEmptyCellIssuesNoRemove) {
    EXPECT_EQ(engine.remove_contained("places", cell::base_cell_index(0)), 0u);
    EXPECT_EQ(engine.remove_contained("nothing", SF_RES9), 0u);
    EXPECT_EQ(store.removes, 0);
    EXPECT_EQ(memory.size("places"), 5u);
}

// =============================================================================
// Decode failures
// =============================================================================

TEST_F(RangeQueryTest, MalformedScoreAbortsIndexedQuery) {
    // Digit 7 at resolution 15 sits numerically inside SF_RES9's range
    const CellIndex broken = cell::set_digit(min_child(SF_RES9), 15, cell::DIGIT_UNUSED);
    ASSERT_FALSE(cell::is_well_formed(broken));
    memory.insert("places", {{"broken", ScoreCodec::encode(broken)}});

    EXPECT_THROW(engine.contained_entries("places", SF_RES9, true), DecodeFailureError);
    try {
        engine.contained_entries("places", SF_RES9, true);
        FAIL() << "expected DecodeFailureError";
    } catch (const DecodeFailureError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DECODE_FAILURE);
        EXPECT_EQ(e.score(), ScoreCodec::encode(broken));
    }

    // Without indices nothing is decoded
    EXPECT_EQ(engine.contained_entries("places", SF_RES9, false).size(), 4u);
    EXPECT_EQ(engine.count_contained("places", SF_RES9), 4u);
}

TEST_F(RangeQueryTest, DecodeChecked) {
    EXPECT_EQ(engine.decode_checked(ScoreCodec::encode(in_mid)), in_mid);
    EXPECT_THROW(engine.decode_checked(ScoreCodec::encode(cell::set_digit(in_mid, 3, 7))), DecodeFailureError);
}

TEST_F(RangeQueryTest, DecodeCheckedRejectsOutOfRangeScores) {
    const Score bad[] = {-1.0, std::nan(""), 1e300, ScoreCodec::SCORE_LIMIT,
                         std::numeric_limits<double>::infinity()};
    for (Score s : bad) {
        EXPECT_THROW(engine.decode_checked(s), DecodeFailureError) << s;
    }
}

TEST_F(RangeQueryTest, HugeStoredScoreFailsScanAndLookup) {
    // Would truncate onto a well-formed base cell 0 leaf if it were cast
    memory.insert("places", {{"huge", 1e300}});

    ScanPage page;
    page.cursor = "0";
    page.members = {{"low", ScoreCodec::encode(in_low)}, {"huge", 1e300}};
    EXPECT_THROW(engine.scan_translate(page), DecodeFailureError);

    GeoSet geo(store, indexer);
    EXPECT_THROW(geo.index("places", {"huge"}), DecodeFailureError);
}

// =============================================================================
// Scan translation
// =============================================================================

TEST_F(RangeQueryTest, ScanTranslate) {
    ScanPage page;
    page.cursor = "42";
    page.members = {{"low", ScoreCodec::encode(in_low)}, {"far", ScoreCodec::encode(out_far)}};

    IndexedScanPage out = engine.scan_translate(page);
    EXPECT_EQ(out.cursor, "42");
    ASSERT_EQ(out.entries.size(), 2u);
    EXPECT_EQ(out.entries[0], std::make_pair(std::string("low"), cell::to_string(in_low)));
    EXPECT_EQ(out.entries[1], std::make_pair(std::string("far"), std::string("8f283082a30e209")));
}

TEST_F(RangeQueryTest, ScanTranslateEmptyPage) {
    ScanPage page;
    page.cursor = "0";
    IndexedScanPage out = engine.scan_translate(page);
    EXPECT_EQ(out.cursor, "0");
    EXPECT_TRUE(out.entries.empty());
}

TEST_F(RangeQueryTest, ScanTranslateRejectsMalformedScore) {
    ScanPage page;
    page.cursor = "0";
    page.members = {{"ok", ScoreCodec::encode(in_low)},
                    {"bad", ScoreCodec::encode(cell::set_digit(in_low, 10, 7))}};
    EXPECT_THROW(engine.scan_translate(page), DecodeFailureError);
}
