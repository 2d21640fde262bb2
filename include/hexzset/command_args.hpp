#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hexzset/distance.hpp"
#include "hexzset/geo_set.hpp"
#include "hexzset/types.hpp"

namespace hexzset {

/**
 * Token-level parsing of geo command arguments (everything after the key).
 * All functions throw InvalidArgumentError with a usage hint on bad syntax;
 * semantic checks (cell validity, resolution) happen later in GeoSet.
 */
namespace args {

// lng lat name [lng lat name ...]
std::vector<GeoMember> parse_add(const std::vector<std::string>& tokens);

// idx name [idx name ...]
std::vector<IndexMember> parse_add_by_index(const std::vector<std::string>& tokens);

struct DistArgs {
    std::string name1;
    std::string name2;
    DistanceUnit unit = DistanceUnit::Meters;
};

// name1 name2 [unit]
DistArgs parse_dist(const std::vector<std::string>& tokens);

struct ContainsArgs {
    std::string cell;
    bool with_indices = false;
    std::optional<RangeLimit> limit;
};

// cell [WITHINDICES] [LIMIT offset count]
ContainsArgs parse_contains(const std::vector<std::string>& tokens);

struct ScanArgs {
    std::string cursor;
    std::optional<std::string> match;
    std::optional<size_t> count;
};

// cursor [MATCH pattern] [COUNT count]
ScanArgs parse_scan(const std::vector<std::string>& tokens);

// Strict double / size parsing of a single token
bool parse_double(const std::string& token, double& out);
bool parse_size(const std::string& token, size_t& out);

} // namespace args
} // namespace hexzset
