#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hexzset/types.hpp"

namespace hexzset {

/**
 * Ordered member store: per key, a set of unique names each carrying a
 * double score, ordered by (score, name).
 *
 * hexzset never owns the stored entries; everything above this interface
 * only computes scores and interprets them. Implementations report their own
 * failures (connectivity, statement errors) as StoreError. Each call is one
 * synchronous round trip and is atomic on its own; nothing spans calls.
 */
class MemberStore {
public:
    virtual ~MemberStore() = default;

    /**
     * Upsert by name. Existing names get the new score.
     * @return number of names that were not present before
     */
    virtual size_t insert(const std::string& key, const std::vector<ScoredMember>& members) = 0;

    virtual std::optional<Score> score_of(const std::string& key, const std::string& name) = 0;

    /**
     * Members with min <= score <= max in ascending (score, name) order.
     * When with_scores is false the returned scores are unspecified.
     */
    virtual std::vector<ScoredMember> range_by_score(const std::string& key, Score min, Score max,
                                                     bool with_scores,
                                                     const std::optional<RangeLimit>& limit = std::nullopt) = 0;

    virtual size_t count_by_score(const std::string& key, Score min, Score max) = 0;

    // @return number of names actually removed
    virtual size_t remove(const std::string& key, const std::vector<std::string>& names) = 0;

    /**
     * Cursor enumeration. Start with cursor "0"; the iteration is complete
     * when "0" comes back. `count` is the number of entries examined per call,
     * `match` a glob applied to names after examination, so a page may be
     * shorter than `count` or empty while the cursor is still live.
     */
    virtual ScanPage scan(const std::string& key, const std::string& cursor,
                          const std::optional<std::string>& match = std::nullopt,
                          const std::optional<size_t>& count = std::nullopt) = 0;

    // Round trip check used by the status command
    virtual bool ping() = 0;
};

constexpr size_t DEFAULT_SCAN_COUNT = 10;
constexpr size_t MAX_SCAN_COUNT = 1000000;

/**
 * Entries to examine for one scan call: DEFAULT_SCAN_COUNT when unset,
 * larger requests clamped to MAX_SCAN_COUNT.
 * @throws InvalidArgumentError for a count of 0
 */
size_t scan_count(const std::optional<size_t>& count);

// fnmatch-style glob (*, ?, [...], backslash escapes) against a whole name
bool glob_match(const std::string& pattern, const std::string& name);

/**
 * Parse a scan cursor: a non-negative decimal position.
 * @throws InvalidArgumentError when the cursor is malformed
 */
size_t parse_cursor(const std::string& cursor);

} // namespace hexzset
