#include "hexzset/store/member_store.hpp"
#include "hexzset/error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fnmatch.h>

namespace hexzset {

bool glob_match(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

size_t parse_cursor(const std::string& cursor) {
    HEXZSET_CHECK_ARGUMENT(!cursor.empty() && cursor[0] >= '0' && cursor[0] <= '9',
                           "invalid cursor '" + cursor + "'");
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(cursor.c_str(), &end, 10);
    HEXZSET_CHECK_ARGUMENT(errno != ERANGE && *end == '\0', "invalid cursor '" + cursor + "'");
    return static_cast<size_t>(value);
}

size_t scan_count(const std::optional<size_t>& count) {
    const size_t n = count.value_or(DEFAULT_SCAN_COUNT);
    HEXZSET_CHECK_ARGUMENT(n > 0, "scan count must be positive");
    return std::min(n, MAX_SCAN_COUNT);
}

} // namespace hexzset
