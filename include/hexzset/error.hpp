#pragma once

#include <stdexcept>
#include <string>

namespace hexzset {

/**
 * Structured error reporting for hexzset.
 *
 * Every failure surfaced by the library is a HexzsetException carrying an
 * ErrorCode. Validation failures are local and never transient; StoreError
 * is raised only by MemberStore implementations and is propagated unchanged
 * by the layers above them.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Cell / score validation
    INVALID_INDEX_STRING = 100,
    INVALID_RESOLUTION = 101,
    DECODE_FAILURE = 102,

    // Distance
    UNSUPPORTED_UNIT = 200,

    // Ordered member store
    STORE_ERROR = 300,
    CONNECTION_FAILED = 301
};

const char* error_code_name(ErrorCode code) noexcept;

class HexzsetException : public std::runtime_error {
public:
    explicit HexzsetException(ErrorCode code, const std::string& message,
                              const std::string& context = "")
        : std::runtime_error(format_message(code, message, context))
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
};

class InvalidArgumentError : public HexzsetException {
public:
    explicit InvalidArgumentError(const std::string& message, const std::string& context = "")
        : HexzsetException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

// A cell reference that is neither a 15-digit hex key nor a decimal index,
// or that does not name a valid cell.
class InvalidIndexStringError : public HexzsetException {
public:
    explicit InvalidIndexStringError(const std::string& value, const std::string& context = "")
        : HexzsetException(ErrorCode::INVALID_INDEX_STRING, "invalid cell index '" + value + "'", context)
        , value_(value) {}

    const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

class InvalidResolutionError : public HexzsetException {
public:
    InvalidResolutionError(int resolution, int required, const std::string& context = "")
        : HexzsetException(ErrorCode::INVALID_RESOLUTION,
                           "cell resolution " + std::to_string(resolution) +
                           " where " + std::to_string(required) + " is required", context)
        , resolution_(resolution) {}

    int resolution() const noexcept { return resolution_; }

private:
    int resolution_;
};

// A stored score that does not decode to a valid cell.
class DecodeFailureError : public HexzsetException {
public:
    DecodeFailureError(double score, const std::string& context = "")
        : HexzsetException(ErrorCode::DECODE_FAILURE, "score does not decode to a valid cell: " + format_score(score), context)
        , score_(score) {}

    double score() const noexcept { return score_; }

    // Every bit of a 52-bit integer score, "nan"/"inf" for the rest
    static std::string format_score(double score);

private:

    double score_;
};

class UnsupportedUnitError : public HexzsetException {
public:
    explicit UnsupportedUnitError(const std::string& unit, const std::string& context = "")
        : HexzsetException(ErrorCode::UNSUPPORTED_UNIT,
                           "unsupported unit '" + unit + "', please use m, km, ft, mi", context) {}
};

class StoreError : public HexzsetException {
public:
    explicit StoreError(const std::string& message, const std::string& context = "",
                        ErrorCode code = ErrorCode::STORE_ERROR)
        : HexzsetException(code, message, context) {}
};

#define HEXZSET_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw hexzset::InvalidArgumentError(message, __func__); } while (0)

#define HEXZSET_THROW_STORE(message) \
    throw hexzset::StoreError(message, __func__)

} // namespace hexzset
