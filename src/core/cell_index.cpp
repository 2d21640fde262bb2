#include "hexzset/cell_index.hpp"
#include "hexzset/error.hpp"
#include "hexzset/geo/cell_indexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <regex>

namespace hexzset {
namespace cell {

bool is_well_formed(CellIndex idx) noexcept {
    if (idx & HIGH_BIT_MASK) return false;
    if (get_mode(idx) != MODE_CELL) return false;
    if (idx & RESERVED_MASK) return false;
    if (get_base_cell(idx) >= NUM_BASE_CELLS) return false;

    const int res = get_resolution(idx);
    for (int r = 1; r <= MAX_RESOLUTION; ++r) {
        int digit = get_digit(idx, r);
        if (r <= res) {
            if (digit > DIGIT_MAX) return false;
        } else if (digit != DIGIT_UNUSED) {
            return false;
        }
    }
    return true;
}

std::string to_string(CellIndex idx) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%llx", static_cast<unsigned long long>(idx));
    return buf;
}

std::string to_decimal_string(CellIndex idx) {
    return std::to_string(idx);
}

} // namespace cell

namespace {

bool parse_u64(const std::string& digits, int base, uint64_t& out) {
    if (digits.empty()) return false;
    // strtoull accepts leading whitespace and a sign; neither is a valid index
    if (digits[0] == '-' || digits[0] == '+' || std::isspace(static_cast<unsigned char>(digits[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(digits.c_str(), &end, base);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

} // namespace

CellIndex parse_index_string(const std::string& text, const CellIndexer& indexer) {
    static const std::regex key_pattern("^(0x)?[0-9A-Za-z]{15}$");

    uint64_t value = 0;
    if (std::regex_match(text, key_pattern)) {
        std::string hex = text.size() > cell::KEY_LENGTH ? text.substr(2) : text;
        if (!parse_u64(hex, 16, value)) {
            throw InvalidIndexStringError(text, "hex key");
        }
    } else if (!parse_u64(text, 10, value)) {
        throw InvalidIndexStringError(text, "decimal index");
    }

    if (!indexer.is_valid(value)) {
        throw InvalidIndexStringError(text, "not a valid cell");
    }
    return value;
}

} // namespace hexzset
