#pragma once

#include "hexzset/geo/cell_indexer.hpp"

namespace hexzset {

// CellIndexer backed by the H3 v4 C library
class H3CellIndexer : public CellIndexer {
public:
    CellIndex coordinate_to_index(const GeoPoint& point, int resolution) const override;
    GeoPoint index_to_coordinate(CellIndex index) const override;
    int resolution_of(CellIndex index) const override;
    bool is_valid(CellIndex index) const override;
};

} // namespace hexzset
