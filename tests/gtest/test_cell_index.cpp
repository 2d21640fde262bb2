// =============================================================================
// Cell Index Layout Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"
#include "test_support.hpp"

using namespace hexzset;
using hexzset::testing::LayoutIndexer;
using hexzset::testing::make_cell;

class CellIndexTest : public ::testing::Test {
protected:
    LayoutIndexer indexer;

    // Resolution 9 cell over San Francisco
    static constexpr CellIndex SF_RES9 = 0x8928308280fffffull;
    // One of its resolution 15 descendants
    static constexpr CellIndex SF_LEAF = 0x8f283082a30e209ull;
};

TEST_F(CellIndexTest, FieldAccessors) {
    EXPECT_EQ(cell::get_mode(SF_RES9), 1);
    EXPECT_EQ(cell::get_resolution(SF_RES9), 9);
    EXPECT_EQ(cell::get_base_cell(SF_RES9), 20);

    const int expected[] = {0, 6, 0, 4, 0, 5, 0, 0, 3};
    for (int r = 1; r <= 9; ++r) {
        EXPECT_EQ(cell::get_digit(SF_RES9, r), expected[r - 1]) << "digit " << r;
    }
    for (int r = 10; r <= 15; ++r) {
        EXPECT_EQ(cell::get_digit(SF_RES9, r), cell::DIGIT_UNUSED) << "digit " << r;
    }
}

TEST_F(CellIndexTest, BuilderMatchesKnownCell) {
    EXPECT_EQ(make_cell(20, {0, 6, 0, 4, 0, 5, 0, 0, 3}), SF_RES9);
    EXPECT_EQ(cell::base_cell_index(0), 0x8001fffffffffffull);
}

TEST_F(CellIndexTest, SetResolutionKeepsOtherFields) {
    CellIndex idx = cell::set_resolution(SF_RES9, 15);
    EXPECT_EQ(cell::get_resolution(idx), 15);
    EXPECT_EQ(cell::get_base_cell(idx), 20);
    EXPECT_EQ(cell::get_mode(idx), 1);
    EXPECT_EQ(cell::set_resolution(idx, 9), SF_RES9);
}

TEST_F(CellIndexTest, WellFormed) {
    EXPECT_TRUE(cell::is_well_formed(SF_RES9));
    EXPECT_TRUE(cell::is_well_formed(SF_LEAF));
    EXPECT_TRUE(cell::is_well_formed(cell::base_cell_index(121)));

    EXPECT_FALSE(cell::is_well_formed(0));
    EXPECT_FALSE(cell::is_well_formed(cell::set_mode(SF_RES9, 2)));
    EXPECT_FALSE(cell::is_well_formed(SF_RES9 | cell::HIGH_BIT_MASK));
    EXPECT_FALSE(cell::is_well_formed(SF_RES9 | (uint64_t(1) << cell::RESERVED_OFFSET)));
    EXPECT_FALSE(cell::is_well_formed(cell::base_cell_index(122)));
    // Digit 7 inside the resolution
    EXPECT_FALSE(cell::is_well_formed(cell::set_digit(SF_RES9, 4, 7)));
    // Digit other than 7 past the resolution
    EXPECT_FALSE(cell::is_well_formed(cell::set_digit(SF_RES9, 12, 0)));
}

TEST_F(CellIndexTest, ToString) {
    EXPECT_EQ(cell::to_string(SF_RES9), "8928308280fffff");
    EXPECT_EQ(cell::to_string(SF_LEAF), "8f283082a30e209");
    EXPECT_EQ(cell::to_decimal_string(SF_LEAF), std::to_string(SF_LEAF));
}

TEST_F(CellIndexTest, ParseHexKey) {
    EXPECT_EQ(parse_index_string("8928308280fffff", indexer), SF_RES9);
    EXPECT_EQ(parse_index_string("0x8928308280fffff", indexer), SF_RES9);
    EXPECT_EQ(parse_index_string("8928308280FFFFF", indexer), SF_RES9);
}

TEST_F(CellIndexTest, ParseDecimal) {
    EXPECT_EQ(parse_index_string(std::to_string(SF_LEAF), indexer), SF_LEAF);
}

TEST_F(CellIndexTest, ParseRejectsGarbage) {
    EXPECT_THROW(parse_index_string("", indexer), InvalidIndexStringError);
    EXPECT_THROW(parse_index_string("not-a-cell", indexer), InvalidIndexStringError);
    // 15 characters but not hex
    EXPECT_THROW(parse_index_string("892830828zfffff", indexer), InvalidIndexStringError);
    EXPECT_THROW(parse_index_string("-12345", indexer), InvalidIndexStringError);
    EXPECT_THROW(parse_index_string("99999999999999999999999", indexer), InvalidIndexStringError);
}

TEST_F(CellIndexTest, ParseRejectsInvalidCell) {
    // Parses as a number but is not a cell
    EXPECT_THROW(parse_index_string("12345", indexer), InvalidIndexStringError);
    try {
        parse_index_string("12345", indexer);
        FAIL() << "expected InvalidIndexStringError";
    } catch (const InvalidIndexStringError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_INDEX_STRING);
        EXPECT_EQ(e.value(), "12345");
    }
}
