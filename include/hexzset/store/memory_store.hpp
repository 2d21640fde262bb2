#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "hexzset/store/member_store.hpp"

namespace hexzset {

/**
 * In-process MemberStore. Each key holds a name -> score hash plus a
 * (score, name) ordered index, the same two-index layout a sorted set uses.
 * One mutex serializes all operations.
 */
class MemoryMemberStore : public MemberStore {
public:
    MemoryMemberStore() = default;

    MemoryMemberStore(const MemoryMemberStore&) = delete;
    MemoryMemberStore& operator=(const MemoryMemberStore&) = delete;

    size_t insert(const std::string& key, const std::vector<ScoredMember>& members) override;
    std::optional<Score> score_of(const std::string& key, const std::string& name) override;
    std::vector<ScoredMember> range_by_score(const std::string& key, Score min, Score max,
                                             bool with_scores,
                                             const std::optional<RangeLimit>& limit = std::nullopt) override;
    size_t count_by_score(const std::string& key, Score min, Score max) override;
    size_t remove(const std::string& key, const std::vector<std::string>& names) override;
    ScanPage scan(const std::string& key, const std::string& cursor,
                  const std::optional<std::string>& match = std::nullopt,
                  const std::optional<size_t>& count = std::nullopt) override;
    bool ping() override { return true; }

    // Number of members under key (0 for a missing key)
    size_t size(const std::string& key) const;

private:
    struct SortedSet {
        std::unordered_map<std::string, Score> by_name;
        std::set<std::pair<Score, std::string>> by_score;
    };

    mutable std::mutex mutex_;
    std::map<std::string, SortedSet> sets_;
};

} // namespace hexzset
