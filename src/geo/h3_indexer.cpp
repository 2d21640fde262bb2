#include "hexzset/geo/h3_indexer.hpp"
#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"

#include <h3/h3api.h>

#include <cmath>
#include <string>

namespace hexzset {

CellIndex H3CellIndexer::coordinate_to_index(const GeoPoint& point, int resolution) const {
    HEXZSET_CHECK_ARGUMENT(std::isfinite(point.lon) && std::isfinite(point.lat),
                           "Invalid lng or lat value");
    HEXZSET_CHECK_ARGUMENT(resolution >= cell::MIN_RESOLUTION && resolution <= cell::MAX_RESOLUTION,
                           "resolution out of range: " + std::to_string(resolution));

    LatLng coord;
    coord.lat = degsToRads(point.lat);
    coord.lng = degsToRads(point.lon);

    H3Index out = 0;
    H3Error err = latLngToCell(&coord, resolution, &out);
    if (err != E_SUCCESS) {
        throw InvalidArgumentError("cannot index coordinate (" + std::to_string(point.lon) + ", " +
                                   std::to_string(point.lat) + ")", "latLngToCell error " + std::to_string(err));
    }
    return out;
}

GeoPoint H3CellIndexer::index_to_coordinate(CellIndex index) const {
    LatLng coord;
    H3Error err = cellToLatLng(index, &coord);
    if (err != E_SUCCESS) {
        throw InvalidIndexStringError(cell::to_string(index), "cellToLatLng error " + std::to_string(err));
    }
    return GeoPoint(radsToDegs(coord.lng), radsToDegs(coord.lat));
}

int H3CellIndexer::resolution_of(CellIndex index) const {
    return getResolution(index);
}

bool H3CellIndexer::is_valid(CellIndex index) const {
    return isValidCell(index) != 0;
}

} // namespace hexzset
