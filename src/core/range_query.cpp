#include "hexzset/range_query.hpp"
#include "hexzset/cell_bounds.hpp"
#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"
#include "hexzset/logging.hpp"
#include "hexzset/score_codec.hpp"
#include "hexzset/geo/cell_indexer.hpp"
#include "hexzset/store/member_store.hpp"

namespace hexzset {

ScoreBounds SpatialRangeQueryEngine::bounds_for(CellIndex cell) noexcept {
    const CellBounds leaves = leaf_bounds(cell);
    return ScoreBounds{ScoreCodec::encode(leaves.min), ScoreCodec::encode(leaves.max)};
}

CellIndex SpatialRangeQueryEngine::decode_checked(Score score) const {
    if (!ScoreCodec::in_range(score)) {
        LOG_ERROR("Stored score ", DecodeFailureError::format_score(score), " is outside the leaf score range");
        throw DecodeFailureError(score, "outside [0, 2^52)");
    }
    const CellIndex idx = ScoreCodec::decode(score);
    if (!indexer_.is_valid(idx)) {
        LOG_ERROR("Stored score ", DecodeFailureError::format_score(score), " decodes to invalid cell ", cell::to_string(idx));
        throw DecodeFailureError(score, cell::to_string(idx));
    }
    return idx;
}

std::vector<ContainedEntry> SpatialRangeQueryEngine::contained_entries(const std::string& key, CellIndex cell,
                                                                      bool with_indices,
                                                                      const std::optional<RangeLimit>& limit) {
    const ScoreBounds bounds = bounds_for(cell);
    LOG_DEBUG("contained_entries key=", key, " cell=", cell::to_string(cell),
              " range=[", static_cast<uint64_t>(bounds.min), ", ", static_cast<uint64_t>(bounds.max), "]");

    std::vector<ScoredMember> members = store_.range_by_score(key, bounds.min, bounds.max, with_indices, limit);

    std::vector<ContainedEntry> entries;
    entries.reserve(members.size());
    for (auto& m : members) {
        ContainedEntry entry;
        entry.name = std::move(m.name);
        if (with_indices) {
            entry.index = cell::to_string(decode_checked(m.score));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

size_t SpatialRangeQueryEngine::count_contained(const std::string& key, CellIndex cell) {
    const ScoreBounds bounds = bounds_for(cell);
    return store_.count_by_score(key, bounds.min, bounds.max);
}

size_t SpatialRangeQueryEngine::remove_contained(const std::string& key, CellIndex cell) {
    std::vector<ContainedEntry> entries = contained_entries(key, cell, false);
    if (entries.empty()) {
        return 0;
    }

    std::vector<std::string> names;
    names.reserve(entries.size());
    for (auto& e : entries) {
        names.push_back(std::move(e.name));
    }

    const size_t removed = store_.remove(key, names);
    LOG_DEBUG("remove_contained key=", key, " cell=", cell::to_string(cell),
              " matched=", names.size(), " removed=", removed);
    return removed;
}

IndexedScanPage SpatialRangeQueryEngine::scan_translate(const ScanPage& page) const {
    IndexedScanPage out;
    out.cursor = page.cursor;
    out.entries.reserve(page.members.size());
    for (const auto& m : page.members) {
        out.entries.emplace_back(m.name, cell::to_string(decode_checked(m.score)));
    }
    return out;
}

} // namespace hexzset
