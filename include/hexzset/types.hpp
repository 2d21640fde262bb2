#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hexzset {

// 64-bit hierarchical cell index. Treated as an opaque value; fields are read
// and written through the accessors in cell_index.hpp.
using CellIndex = uint64_t;

// Sort key of a leaf cell inside the ordered member store.
using Score = double;

// Geographic coordinate in degrees
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;

    constexpr GeoPoint() noexcept = default;
    constexpr GeoPoint(double lon_, double lat_) noexcept : lon(lon_), lat(lat_) {}
};

// One member of a scored set as returned by the store
struct ScoredMember {
    std::string name;
    Score score = 0.0;

    bool operator==(const ScoredMember& o) const noexcept {
        return name == o.name && score == o.score;
    }
};

// Pagination window for range queries (LIMIT offset count)
struct RangeLimit {
    size_t offset = 0;
    size_t count = 0;
};

// One page of a cursor-based enumeration
struct ScanPage {
    std::string cursor;   // "0" once the iteration is complete
    std::vector<ScoredMember> members;
};

// Member of a containment query; index is set only when requested
struct ContainedEntry {
    std::string name;
    std::optional<std::string> index;
};

// A scan page with every score replaced by its leaf index string
struct IndexedScanPage {
    std::string cursor;
    std::vector<std::pair<std::string, std::string>> entries;  // (name, index)
};

} // namespace hexzset
