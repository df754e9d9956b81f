/**
 * @file connection.hpp
 * @brief libpq plumbing for the PostgreSQL keeper: connection settings,
 *        RAII connection/result/transaction and parameterized execution.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <libpq-fe.h>

#include "otree/config.hpp"
#include "otree/error.hpp"

namespace otree::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;

    ConnectionConfig() {
        // db.* keys, which OTREE_DB_* env vars override
        const Config& config = Config::getInstance();
        dbname = config.get<std::string>("db.name", "otree");
        host = config.get<std::string>("db.host", "localhost");
        port = config.get<std::string>("db.port", "5432");
        user = config.get<std::string>("db.user", "postgres");
        password = config.get<std::string>("db.password", "");
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + dbname;
        if (!host.empty()) conninfo += " host=" + host;
        if (!port.empty()) conninfo += " port=" + port;
        if (!user.empty()) conninfo += " user=" + user;
        if (!password.empty()) conninfo += " password=" + password;
        conninfo += " connect_timeout=5";
        return conninfo;
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

    void close() {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

private:
    PGconn* conn_;
};

// RAII wrapper for PGresult
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

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    std::string str(int row, int col) const {
        const char* val = PQgetvalue(res_, row, col);
        return val ? std::string(val) : std::string();
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const std::string& sql) {
    return Result(PQexec(conn, sql.c_str()));
}

// Execute with text parameters ($1, $2, ...)
inline Result exec_params(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }
    return Result(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                               values.data(), nullptr, nullptr, 0));
}

// Execute and throw DatabaseError on failure
inline Result exec_checked(PGconn* conn, const std::string& sql, const std::vector<std::string>& params = {}) {
    Result res = params.empty() ? exec(conn, sql) : exec_params(conn, sql, params);
    if (!res.ok()) {
        throw DatabaseError("Query failed: " + res.error_message(), sql);
    }
    return res;
}

/**
 * RAII transaction. Rolls back unless commit() was called.
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), committed_(false) {
        exec_checked(conn_, "BEGIN");
    }

    ~Transaction() {
        if (!committed_) {
            PGresult* res = PQexec(conn_, "ROLLBACK");
            PQclear(res);
        }
    }

    void commit() {
        if (!committed_) {
            exec_checked(conn_, "COMMIT");
            committed_ = true;
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool committed_;
};

} // namespace otree::db
