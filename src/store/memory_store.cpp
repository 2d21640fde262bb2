#include "hexzset/store/memory_store.hpp"
#include "hexzset/error.hpp"

#include <iterator>
#include <limits>

namespace hexzset {

size_t MemoryMemberStore::insert(const std::string& key, const std::vector<ScoredMember>& members) {
    std::lock_guard<std::mutex> lock(mutex_);
    SortedSet& set = sets_[key];

    size_t added = 0;
    for (const auto& m : members) {
        auto it = set.by_name.find(m.name);
        if (it == set.by_name.end()) {
            set.by_name.emplace(m.name, m.score);
            set.by_score.emplace(m.score, m.name);
            ++added;
        } else if (it->second != m.score) {
            set.by_score.erase({it->second, m.name});
            set.by_score.emplace(m.score, m.name);
            it->second = m.score;
        }
    }
    return added;
}

std::optional<Score> MemoryMemberStore::score_of(const std::string& key, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto set = sets_.find(key);
    if (set == sets_.end()) return std::nullopt;
    auto it = set->second.by_name.find(name);
    if (it == set->second.by_name.end()) return std::nullopt;
    return it->second;
}

std::vector<ScoredMember> MemoryMemberStore::range_by_score(const std::string& key, Score min, Score max,
                                                            bool with_scores,
                                                            const std::optional<RangeLimit>& limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScoredMember> out;

    auto set = sets_.find(key);
    if (set == sets_.end() || min > max) return out;

    const auto& index = set->second.by_score;
    // Empty string sorts first, so this is the first entry with score >= min
    auto it = index.lower_bound({min, std::string()});

    size_t skip = limit ? limit->offset : 0;
    size_t take = limit ? limit->count : std::numeric_limits<size_t>::max();

    for (; it != index.end() && it->first <= max && take > 0; ++it) {
        if (skip > 0) {
            --skip;
            continue;
        }
        out.push_back(ScoredMember{it->second, with_scores ? it->first : 0.0});
        --take;
    }
    return out;
}

size_t MemoryMemberStore::count_by_score(const std::string& key, Score min, Score max) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto set = sets_.find(key);
    if (set == sets_.end() || min > max) return 0;

    const auto& index = set->second.by_score;
    auto first = index.lower_bound({min, std::string()});
    size_t n = 0;
    for (auto it = first; it != index.end() && it->first <= max; ++it) {
        ++n;
    }
    return n;
}

size_t MemoryMemberStore::remove(const std::string& key, const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto set = sets_.find(key);
    if (set == sets_.end()) return 0;

    size_t removed = 0;
    for (const auto& name : names) {
        auto it = set->second.by_name.find(name);
        if (it == set->second.by_name.end()) continue;
        set->second.by_score.erase({it->second, name});
        set->second.by_name.erase(it);
        ++removed;
    }

    if (set->second.by_name.empty()) {
        sets_.erase(set);
    }
    return removed;
}

ScanPage MemoryMemberStore::scan(const std::string& key, const std::string& cursor,
                                 const std::optional<std::string>& match,
                                 const std::optional<size_t>& count) {
    const size_t position = parse_cursor(cursor);
    const size_t examine = scan_count(count);

    std::lock_guard<std::mutex> lock(mutex_);
    ScanPage page;
    page.cursor = "0";

    auto set = sets_.find(key);
    if (set == sets_.end()) return page;

    const auto& index = set->second.by_score;
    if (position >= index.size()) return page;

    auto it = std::next(index.begin(), static_cast<std::ptrdiff_t>(position));
    size_t examined = 0;
    for (; it != index.end() && examined < examine; ++it, ++examined) {
        if (match && !glob_match(*match, it->second)) continue;
        page.members.push_back(ScoredMember{it->second, it->first});
    }

    if (it != index.end()) {
        page.cursor = std::to_string(position + examined);
    }
    return page;
}

size_t MemoryMemberStore::size(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto set = sets_.find(key);
    return set == sets_.end() ? 0 : set->second.by_name.size();
}

} // namespace hexzset
