#pragma once

#include "hexzset/types.hpp"

namespace hexzset {

/**
 * Geospatial indexing library seam: coordinate <-> cell conversion and cell
 * validation. hexzset itself only manipulates index bits; anything that
 * needs cell geometry goes through this interface.
 */
class CellIndexer {
public:
    virtual ~CellIndexer() = default;

    /**
     * Cell containing `point` at `resolution`.
     * @throws InvalidArgumentError for out-of-domain coordinates
     */
    virtual CellIndex coordinate_to_index(const GeoPoint& point, int resolution) const = 0;

    // Cell centroid in degrees
    virtual GeoPoint index_to_coordinate(CellIndex index) const = 0;

    virtual int resolution_of(CellIndex index) const = 0;

    virtual bool is_valid(CellIndex index) const = 0;
};

} // namespace hexzset
