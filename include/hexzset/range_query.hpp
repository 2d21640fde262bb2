#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hexzset/types.hpp"

namespace hexzset {

class MemberStore;
class CellIndexer;

struct ScoreBounds {
    Score min = 0.0;
    Score max = 0.0;
};

/**
 * Cell containment queries over an ordered member store.
 *
 * Every leaf cell nested under a cell C falls inside
 * [encode(min_child(C)), encode(max_child(C))], and nothing outside C does,
 * so "members inside C" is a single inclusive range-by-score scan.
 *
 * Multi-step operations are not atomic against concurrent writers to the
 * store; see remove_contained().
 */
class SpatialRangeQueryEngine {
public:
    SpatialRangeQueryEngine(MemberStore& store, const CellIndexer& indexer)
        : store_(store), indexer_(indexer) {}

    // Inclusive score range covering all leaf descendants of `cell`
    static ScoreBounds bounds_for(CellIndex cell) noexcept;

    /**
     * Members whose cell is nested under `cell`, ascending by score.
     * With `with_indices`, each entry carries its leaf index string.
     *
     * @throws DecodeFailureError if any returned score does not decode to a
     *         valid cell; nothing is returned in that case
     */
    std::vector<ContainedEntry> contained_entries(const std::string& key, CellIndex cell,
                                                  bool with_indices,
                                                  const std::optional<RangeLimit>& limit = std::nullopt);

    size_t count_contained(const std::string& key, CellIndex cell);

    /**
     * Remove every member nested under `cell`. Reads the names first, then
     * issues one bulk remove; an empty cell issues no remove and returns 0.
     * Members added to the cell between the two calls survive.
     */
    size_t remove_contained(const std::string& key, CellIndex cell);

    /**
     * Replace each score of a scan page by its leaf index string. Names and
     * cursor pass through untouched.
     * @throws DecodeFailureError if any score fails to decode
     */
    IndexedScanPage scan_translate(const ScanPage& page) const;

    /**
     * Decode a stored score and validate the resulting cell.
     * @throws DecodeFailureError
     */
    CellIndex decode_checked(Score score) const;

private:
    MemberStore& store_;
    const CellIndexer& indexer_;
};

} // namespace hexzset
