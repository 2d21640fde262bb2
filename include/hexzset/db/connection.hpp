#pragma once

#include <string>
#include <libpq-fe.h>

#include "hexzset/config.hpp"
#include "hexzset/error.hpp"
#include "hexzset/db/helpers.hpp"

namespace hexzset::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;
    int connect_timeout = 5;
    // Servers before PostgreSQL 12 print 15 significant digits by default;
    // scores need all 17 to come back as the same double
    std::string options = "-c extra_float_digits=3";

    // Defaults come from Config (HZ_DB_* environment or config file)
    ConnectionConfig() {
        const Config& config = Config::getInstance();
        dbname = config.get<std::string>("db.name", "hexzset");
        host = config.get<std::string>("db.host", "localhost");
        port = config.get<std::string>("db.port", "5432");
        user = config.get<std::string>("db.user", "postgres");
        password = config.get<std::string>("db.password", "");
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + quote(dbname);
        if (!host.empty()) conninfo += " host=" + quote(host);
        if (!port.empty()) conninfo += " port=" + quote(port);
        if (!user.empty()) conninfo += " user=" + quote(user);
        if (!password.empty()) conninfo += " password=" + quote(password);
        if (connect_timeout > 0) conninfo += " connect_timeout=" + std::to_string(connect_timeout);
        if (!options.empty()) conninfo += " options=" + quote(options);
        return conninfo;
    }

    // user@host:port/dbname, without the password
    std::string describe() const {
        return user + "@" + (host.empty() ? std::string("local") : host) + ":" +
               (port.empty() ? std::string("5432") : port) + "/" + dbname;
    }

    // Parse from command line args (advances i past a consumed value).
    // Returns false if the arg is not a connection option.
    bool parse_arg(int argc, char** argv, int& i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--dbname") && i + 1 < argc) {
            dbname = argv[++i];
            return true;
        }
        if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
            return true;
        }
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
            return true;
        }
        if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            user = argv[++i];
            return true;
        }
        if ((arg == "-W" || arg == "--password") && i + 1 < argc) {
            password = argv[++i];
            return true;
        }
        return false;
    }

private:
    // conninfo values: single-quoted with ' and \ escaped
    static std::string quote(const std::string& value) {
        std::string out = "'";
        for (char ch : value) {
            if (ch == '\'' || ch == '\\') out += '\\';
            out += ch;
        }
        out += '\'';
        return out;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

/**
 * RAII transaction. Rolls back unless commit() was called.
 *
 *   {
 *       Transaction tx(conn);
 *       exec_params(conn, "INSERT ...", ...);
 *       tx.commit();
 *   }
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), done_(false) {
        Result res = exec(conn_, "BEGIN");
        if (!res.ok()) {
            throw StoreError("BEGIN failed: " + res.error_message(), "Transaction");
        }
    }

    ~Transaction() {
        if (!done_) {
            PQclear(PQexec(conn_, "ROLLBACK"));
        }
    }

    void commit() {
        if (done_) return;
        done_ = true;
        Result res = exec(conn_, "COMMIT");
        if (!res.ok()) {
            throw StoreError("COMMIT failed: " + res.error_message(), "Transaction");
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool done_;
};

} // namespace hexzset::db
