#include "hexzset/db/pg_member_store.hpp"
#include "hexzset/logging.hpp"

#include <algorithm>
#include <cctype>

namespace hexzset::db {

namespace {

bool is_identifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

} // namespace

PgMemberStore::PgMemberStore(Connection conn, std::string table)
    : conn_(std::move(conn)), table_(std::move(table)) {
    if (!conn_.ok()) {
        LOG_ERROR("Database connection failed: ", conn_.error());
        throw StoreError(std::string("connection failed: ") + conn_.error(), "PgMemberStore",
                         ErrorCode::CONNECTION_FAILED);
    }
    if (!is_identifier(table_)) {
        throw StoreError("invalid table name '" + table_ + "'", "PgMemberStore");
    }
}

Result PgMemberStore::run(const std::string& sql, const std::vector<std::string>& params, const char* what) {
    Result res = exec_params(conn_, sql, params);
    if (!res.ok()) {
        std::string msg = res.error_message();
        LOG_ERROR(what, " failed on ", table_, ": ", msg);
        throw StoreError(msg, what);
    }
    return res;
}

void PgMemberStore::ensure_schema() {
    run("CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "key text NOT NULL, "
        "name text NOT NULL, "
        "score double precision NOT NULL, "
        "PRIMARY KEY (key, name))", {}, "create table");
    run("CREATE INDEX IF NOT EXISTS " + table_ + "_score_idx ON " + table_ + " (key, score, name)",
        {}, "create index");
    LOG_DEBUG("Schema ready: ", table_);
}

size_t PgMemberStore::insert(const std::string& key, const std::vector<ScoredMember>& members) {
    if (members.empty()) return 0;

    // xmax = 0 only on a freshly inserted row, not on the update path
    const std::string sql =
        "INSERT INTO " + table_ + " (key, name, score) VALUES ($1, $2, $3::double precision) "
        "ON CONFLICT (key, name) DO UPDATE SET score = EXCLUDED.score "
        "RETURNING (xmax = 0) AS inserted";

    size_t added = 0;
    Transaction tx(conn_);
    for (const auto& m : members) {
        Result res = run(sql, {key, m.name, format_double(m.score)}, "insert");
        if (res.ntuples() > 0 && res.str(0, 0) == "t") {
            ++added;
        }
    }
    tx.commit();
    return added;
}

std::optional<Score> PgMemberStore::score_of(const std::string& key, const std::string& name) {
    Result res = run("SELECT score FROM " + table_ + " WHERE key = $1 AND name = $2",
                     {key, name}, "score_of");
    if (res.ntuples() == 0) {
        return std::nullopt;
    }
    return res.dbl(0, 0);
}

std::vector<ScoredMember> PgMemberStore::range_by_score(const std::string& key, Score min, Score max,
                                                        bool with_scores,
                                                        const std::optional<RangeLimit>& limit) {
    std::string sql = "SELECT name, score FROM " + table_ +
                      " WHERE key = $1 AND score >= $2::double precision AND score <= $3::double precision"
                      " ORDER BY score, name";
    std::vector<std::string> params = {key, format_double(min), format_double(max)};
    if (limit) {
        sql += " LIMIT $4 OFFSET $5";
        params.push_back(std::to_string(limit->count));
        params.push_back(std::to_string(limit->offset));
    }

    Result res = run(sql, params, "range_by_score");

    std::vector<ScoredMember> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    for (int i = 0; i < res.ntuples(); ++i) {
        out.push_back(ScoredMember{res.str(i, 0), with_scores ? res.dbl(i, 1) : 0.0});
    }
    return out;
}

size_t PgMemberStore::count_by_score(const std::string& key, Score min, Score max) {
    Result res = run("SELECT count(*) FROM " + table_ +
                     " WHERE key = $1 AND score >= $2::double precision AND score <= $3::double precision",
                     {key, format_double(min), format_double(max)}, "count_by_score");
    return static_cast<size_t>(res.int64(0, 0));
}

size_t PgMemberStore::remove(const std::string& key, const std::vector<std::string>& names) {
    if (names.empty()) return 0;

    const std::string sql = "DELETE FROM " + table_ + " WHERE key = $1 AND name = $2";

    size_t removed = 0;
    Transaction tx(conn_);
    for (const auto& name : names) {
        Result res = run(sql, {key, name}, "remove");
        removed += static_cast<size_t>(res.affected());
    }
    tx.commit();
    return removed;
}

ScanPage PgMemberStore::scan(const std::string& key, const std::string& cursor,
                             const std::optional<std::string>& match,
                             const std::optional<size_t>& count) {
    const size_t position = parse_cursor(cursor);
    const size_t examine = scan_count(count);

    // One extra row tells whether another page exists
    Result res = run("SELECT name, score FROM " + table_ +
                     " WHERE key = $1 ORDER BY score, name LIMIT $2 OFFSET $3",
                     {key, std::to_string(examine + 1), std::to_string(position)}, "scan");

    ScanPage page;
    const size_t rows = static_cast<size_t>(res.ntuples());
    const size_t examined = std::min(rows, examine);
    for (size_t i = 0; i < examined; ++i) {
        std::string name = res.str(static_cast<int>(i), 0);
        if (match && !glob_match(*match, name)) continue;
        page.members.push_back(ScoredMember{std::move(name), res.dbl(static_cast<int>(i), 1)});
    }
    page.cursor = rows > examine ? std::to_string(position + examine) : "0";
    return page;
}

bool PgMemberStore::ping() {
    Result res = exec(conn_, "SELECT 1");
    if (!res.ok()) {
        LOG_WARN("ping failed: ", res.error_message());
        return false;
    }
    return true;
}

} // namespace hexzset::db
