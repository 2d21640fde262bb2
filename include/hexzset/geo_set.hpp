#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hexzset/distance.hpp"
#include "hexzset/range_query.hpp"
#include "hexzset/types.hpp"

namespace hexzset {

class MemberStore;
class CellIndexer;

// A named point for GeoSet::add
struct GeoMember {
    GeoPoint point;
    std::string name;
};

// A named cell reference (hex key or decimal) for GeoSet::add_by_index
struct IndexMember {
    std::string index;
    std::string name;
};

/**
 * Geo commands over one ordered member store: named points stored as leaf
 * cell scores, queried by name, by distance and by cell containment.
 *
 * Points are always indexed at resolution 15; a score holds no resolution
 * information.
 */
class GeoSet {
public:
    static constexpr int STORAGE_RESOLUTION = 15;

    GeoSet(MemberStore& store, const CellIndexer& indexer)
        : store_(store), indexer_(indexer), engine_(store, indexer) {}

    // "Ok" once the store answers
    std::string status();

    /**
     * Index each point at resolution 15 and upsert it.
     * @return number of newly added names
     * @throws InvalidArgumentError for coordinates outside lon [-180, 180],
     *         lat [-90, 90]
     */
    size_t add(const std::string& key, const std::vector<GeoMember>& members);

    /**
     * Upsert pre-computed leaf cells.
     * @throws InvalidIndexStringError, InvalidResolutionError
     */
    size_t add_by_index(const std::string& key, const std::vector<IndexMember>& members);

    // Leaf index string per name; nullopt for names not in the set
    std::vector<std::optional<std::string>> index(const std::string& key,
                                                  const std::vector<std::string>& names);

    // Cell centroid per name; nullopt for names not in the set
    std::vector<std::optional<GeoPoint>> pos(const std::string& key,
                                             const std::vector<std::string>& names);

    // Distance between two members' cell centroids; nullopt if either is missing
    std::optional<double> dist(const std::string& key, const std::string& name1,
                               const std::string& name2, DistanceUnit unit = DistanceUnit::Meters);

    std::vector<ContainedEntry> contains(const std::string& key, const std::string& cell,
                                         bool with_indices,
                                         const std::optional<RangeLimit>& limit = std::nullopt);

    size_t count(const std::string& key, const std::string& cell);

    size_t remove_contained(const std::string& key, const std::string& cell);

    IndexedScanPage scan(const std::string& key, const std::string& cursor,
                         const std::optional<std::string>& match = std::nullopt,
                         const std::optional<size_t>& count = std::nullopt);

    SpatialRangeQueryEngine& engine() { return engine_; }

private:
    std::optional<CellIndex> stored_cell(const std::string& key, const std::string& name);

    MemberStore& store_;
    const CellIndexer& indexer_;
    SpatialRangeQueryEngine engine_;
};

} // namespace hexzset
