#include "hexzset/geo_set.hpp"
#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"
#include "hexzset/logging.hpp"
#include "hexzset/score_codec.hpp"
#include "hexzset/geo/cell_indexer.hpp"
#include "hexzset/store/member_store.hpp"

#include <cmath>

namespace hexzset {

namespace {

bool in_domain(const GeoPoint& p) {
    return std::isfinite(p.lon) && std::isfinite(p.lat) &&
           p.lon >= -180.0 && p.lon <= 180.0 &&
           p.lat >= -90.0 && p.lat <= 90.0;
}

} // namespace

std::string GeoSet::status() {
    if (!store_.ping()) {
        HEXZSET_THROW_STORE("store did not answer");
    }
    return "Ok";
}

size_t GeoSet::add(const std::string& key, const std::vector<GeoMember>& members) {
    HEXZSET_CHECK_ARGUMENT(!members.empty(), "no members to add");

    std::vector<ScoredMember> scored;
    scored.reserve(members.size());
    for (const auto& m : members) {
        if (!in_domain(m.point)) {
            throw InvalidArgumentError("Invalid lng or lat value",
                                       "(" + std::to_string(m.point.lon) + ", " + std::to_string(m.point.lat) + ")");
        }
        CellIndex leaf = indexer_.coordinate_to_index(m.point, STORAGE_RESOLUTION);
        scored.push_back(ScoredMember{m.name, ScoreCodec::encode(leaf)});
    }
    return store_.insert(key, scored);
}

size_t GeoSet::add_by_index(const std::string& key, const std::vector<IndexMember>& members) {
    HEXZSET_CHECK_ARGUMENT(!members.empty(), "no members to add");

    // Validate everything before the first write
    std::vector<ScoredMember> scored;
    scored.reserve(members.size());
    for (const auto& m : members) {
        CellIndex idx = parse_index_string(m.index, indexer_);
        int res = indexer_.resolution_of(idx);
        if (res != STORAGE_RESOLUTION) {
            throw InvalidResolutionError(res, STORAGE_RESOLUTION, m.index);
        }
        scored.push_back(ScoredMember{m.name, ScoreCodec::encode(idx)});
    }
    return store_.insert(key, scored);
}

std::optional<CellIndex> GeoSet::stored_cell(const std::string& key, const std::string& name) {
    std::optional<Score> score = store_.score_of(key, name);
    if (!score) {
        return std::nullopt;
    }
    return engine_.decode_checked(*score);
}

std::vector<std::optional<std::string>> GeoSet::index(const std::string& key,
                                                      const std::vector<std::string>& names) {
    std::vector<std::optional<std::string>> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        std::optional<CellIndex> idx = stored_cell(key, name);
        if (idx) {
            out.emplace_back(cell::to_string(*idx));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

std::vector<std::optional<GeoPoint>> GeoSet::pos(const std::string& key,
                                                 const std::vector<std::string>& names) {
    std::vector<std::optional<GeoPoint>> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        std::optional<CellIndex> idx = stored_cell(key, name);
        if (idx) {
            out.emplace_back(indexer_.index_to_coordinate(*idx));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

std::optional<double> GeoSet::dist(const std::string& key, const std::string& name1,
                                   const std::string& name2, DistanceUnit unit) {
    std::optional<CellIndex> a = stored_cell(key, name1);
    std::optional<CellIndex> b = stored_cell(key, name2);
    if (!a || !b) {
        return std::nullopt;
    }
    double meters = haversine_distance(indexer_.index_to_coordinate(*a), indexer_.index_to_coordinate(*b));
    return meters_to(meters, unit);
}

std::vector<ContainedEntry> GeoSet::contains(const std::string& key, const std::string& cell,
                                             bool with_indices, const std::optional<RangeLimit>& limit) {
    return engine_.contained_entries(key, parse_index_string(cell, indexer_), with_indices, limit);
}

size_t GeoSet::count(const std::string& key, const std::string& cell) {
    return engine_.count_contained(key, parse_index_string(cell, indexer_));
}

size_t GeoSet::remove_contained(const std::string& key, const std::string& cell) {
    size_t removed = engine_.remove_contained(key, parse_index_string(cell, indexer_));
    LOG_INFO("Removed ", removed, " members of ", key, " inside ", cell);
    return removed;
}

IndexedScanPage GeoSet::scan(const std::string& key, const std::string& cursor,
                             const std::optional<std::string>& match,
                             const std::optional<size_t>& count) {
    return engine_.scan_translate(store_.scan(key, cursor, match, count));
}

} // namespace hexzset
