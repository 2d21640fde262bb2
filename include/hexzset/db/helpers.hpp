/**
 * @file helpers.hpp
 * @brief libpq result access and statement execution helpers
 *
 * Scores travel as text parameters formatted with %.17g, which is exact for
 * every 52-bit integer score, and come back through get_double().
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace hexzset::db {

// =============================================================================
// Result Value Extraction
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

inline double get_double(PGresult* res, int row, int col, double default_val = 0.0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

/**
 * Rows affected by the last INSERT/UPDATE/DELETE.
 */
inline int64_t cmd_tuples(PGresult* res) {
    if (!res) return 0;
    const char* val = PQcmdTuples(res);
    if (!val || *val == '\0') return 0;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        return 0;
    }
}

// Text form of a double parameter
inline std::string format_double(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

// =============================================================================
// Query Execution
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }
    double dbl(int row, int col, double def = 0.0) const { return get_double(res_, row, col, def); }
    int64_t affected() const { return cmd_tuples(res_); }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const std::string& sql) {
    return Result(PQexec(conn, sql.c_str()));
}

/**
 * Execute a parameterized statement with all parameters in text format.
 */
inline Result exec_params(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }
    return Result(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                               values.data(), nullptr, nullptr, 0));
}

} // namespace hexzset::db
