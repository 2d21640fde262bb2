#include "hexzset/error.hpp"

#include <cstdio>

namespace hexzset {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_INDEX_STRING: return "INVALID_INDEX_STRING";
        case ErrorCode::INVALID_RESOLUTION:   return "INVALID_RESOLUTION";
        case ErrorCode::DECODE_FAILURE:       return "DECODE_FAILURE";
        case ErrorCode::UNSUPPORTED_UNIT:     return "UNSUPPORTED_UNIT";
        case ErrorCode::STORE_ERROR:          return "STORE_ERROR";
        case ErrorCode::CONNECTION_FAILED:    return "CONNECTION_FAILED";
    }
    return "UNKNOWN";
}

std::string DecodeFailureError::format_score(double score) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", score);
    return buf;
}

} // namespace hexzset
