#pragma once

#include <string>

#include "hexzset/db/connection.hpp"
#include "hexzset/store/member_store.hpp"

namespace hexzset::db {

/**
 * MemberStore on a PostgreSQL table:
 *
 *   <table> (key text, name text, score double precision,
 *            PRIMARY KEY (key, name))
 *   index on (key, score, name)
 *
 * Every operation is one statement, or one transaction for the bulk ones.
 * Errors surface as StoreError with the server message.
 */
class PgMemberStore : public MemberStore {
public:
    /**
     * Takes ownership of an open connection.
     * @throws StoreError if the connection is not usable or the table name
     *         is not a plain identifier
     */
    PgMemberStore(Connection conn, std::string table = "hexzset_member");

    // Create the member table and its score index if missing
    void ensure_schema();

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
    bool ping() override;

    const std::string& table() const { return table_; }

private:
    Result run(const std::string& sql, const std::vector<std::string>& params, const char* what);

    Connection conn_;
    std::string table_;
};

} // namespace hexzset::db
