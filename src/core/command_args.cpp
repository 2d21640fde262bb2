#include "hexzset/command_args.hpp"
#include "hexzset/error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace hexzset {
namespace args {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

bool parse_double(const std::string& token, double& out) {
    if (token.empty() || std::isspace(static_cast<unsigned char>(token[0]))) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (errno == ERANGE || *end != '\0' || std::isnan(v)) return false;
    out = v;
    return true;
}

bool parse_size(const std::string& token, size_t& out) {
    if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0]))) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(token.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') return false;
    out = static_cast<size_t>(v);
    return true;
}

std::vector<GeoMember> parse_add(const std::vector<std::string>& tokens) {
    HEXZSET_CHECK_ARGUMENT(!tokens.empty() && tokens.size() % 3 == 0,
                           "syntax error. Try ADD key [lng1] [lat1] [name1] [lng2] [lat2] [name2] ...");

    std::vector<GeoMember> members;
    members.reserve(tokens.size() / 3);
    for (size_t i = 0; i < tokens.size(); i += 3) {
        GeoMember m;
        if (!parse_double(tokens[i], m.point.lon) || !parse_double(tokens[i + 1], m.point.lat)) {
            throw InvalidArgumentError("Invalid lng or lat value", tokens[i] + " " + tokens[i + 1]);
        }
        m.name = tokens[i + 2];
        members.push_back(std::move(m));
    }
    return members;
}

std::vector<IndexMember> parse_add_by_index(const std::vector<std::string>& tokens) {
    HEXZSET_CHECK_ARGUMENT(!tokens.empty() && tokens.size() % 2 == 0,
                           "syntax error. Try ADDBYINDEX key [idx1] [name1] [idx2] [name2] ...");

    std::vector<IndexMember> members;
    members.reserve(tokens.size() / 2);
    for (size_t i = 0; i < tokens.size(); i += 2) {
        members.push_back(IndexMember{tokens[i], tokens[i + 1]});
    }
    return members;
}

DistArgs parse_dist(const std::vector<std::string>& tokens) {
    HEXZSET_CHECK_ARGUMENT(tokens.size() == 2 || tokens.size() == 3,
                           "syntax error. Try DIST key member1 member2 [m|km|ft|mi]");
    DistArgs out;
    out.name1 = tokens[0];
    out.name2 = tokens[1];
    if (tokens.size() == 3) {
        out.unit = parse_unit(tokens[2]);
    }
    return out;
}

ContainsArgs parse_contains(const std::vector<std::string>& tokens) {
    HEXZSET_CHECK_ARGUMENT(!tokens.empty(),
                           "syntax error. Try CONTAINS key cell [WITHINDICES] [LIMIT offset count]");
    ContainsArgs out;
    out.cell = tokens[0];

    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string opt = upper(tokens[i]);
        if (opt == "WITHINDICES") {
            out.with_indices = true;
        } else if (opt == "LIMIT" && i + 2 < tokens.size()) {
            RangeLimit limit;
            if (!parse_size(tokens[i + 1], limit.offset) || !parse_size(tokens[i + 2], limit.count)) {
                throw InvalidArgumentError("LIMIT offset and count must be non-negative integers");
            }
            out.limit = limit;
            i += 2;
        } else {
            throw InvalidArgumentError("syntax error near '" + tokens[i] + "'");
        }
    }
    return out;
}

ScanArgs parse_scan(const std::vector<std::string>& tokens) {
    HEXZSET_CHECK_ARGUMENT(!tokens.empty(),
                           "syntax error. Try SCAN key cursor [MATCH pattern] [COUNT count]");
    ScanArgs out;
    out.cursor = tokens[0];

    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string opt = upper(tokens[i]);
        if (opt == "MATCH" && i + 1 < tokens.size()) {
            out.match = tokens[++i];
        } else if (opt == "COUNT" && i + 1 < tokens.size()) {
            size_t n = 0;
            if (!parse_size(tokens[++i], n) || n == 0) {
                throw InvalidArgumentError("COUNT must be a positive integer");
            }
            out.count = n;
        } else {
            throw InvalidArgumentError("syntax error near '" + tokens[i] + "'");
        }
    }
    return out;
}

} // namespace args
} // namespace hexzset
