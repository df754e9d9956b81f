#include "otree/keeper/pg_keeper.hpp"
#include "otree/logging.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace otree {

namespace {

constexpr const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS otree_keeper_announced (
    table_id    TEXT   NOT NULL,
    revision_id BIGINT NOT NULL,
    cube        TEXT   NOT NULL,
    PRIMARY KEY (table_id, revision_id, cube)
);
CREATE TABLE IF NOT EXISTS otree_keeper_replicated (
    table_id    TEXT   NOT NULL,
    revision_id BIGINT NOT NULL,
    cube        TEXT   NOT NULL,
    PRIMARY KEY (table_id, revision_id, cube)
);
CREATE TABLE IF NOT EXISTS otree_keeper_reserved (
    table_id    TEXT   NOT NULL,
    revision_id BIGINT NOT NULL,
    cube        TEXT   NOT NULL,
    session_id  TEXT   NOT NULL,
    PRIMARY KEY (table_id, revision_id, cube)
);
CREATE INDEX IF NOT EXISTS otree_keeper_reserved_session ON otree_keeper_reserved (session_id);
)SQL";

constexpr const char* CANDIDATES_SQL = R"SQL(
SELECT a.cube
FROM otree_keeper_announced a
WHERE a.table_id = $1 AND a.revision_id = $2
  AND NOT EXISTS (SELECT 1 FROM otree_keeper_replicated r
                  WHERE r.table_id = a.table_id AND r.revision_id = a.revision_id AND r.cube = a.cube)
  AND NOT EXISTS (SELECT 1 FROM otree_keeper_reserved s
                  WHERE s.table_id = a.table_id AND s.revision_id = a.revision_id AND s.cube = a.cube)
ORDER BY a.cube COLLATE "C"
LIMIT $3
FOR UPDATE OF a SKIP LOCKED
)SQL";

std::string new_session_id() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

class PgWriteSession : public WriteSession {
public:
    using WriteSession::WriteSession;

    void end() override {
        LOG_DEBUG("Write session ", id(), " ended");
    }
};

} // anonymous namespace

class PgOptimizationSession : public OptimizationSession {
public:
    PgOptimizationSession(PgKeeper& keeper, std::string table_id, RevisionID revision_id,
                          std::string id, std::vector<std::string> cubes)
        : OptimizationSession(std::move(id), std::move(cubes)), keeper_(keeper),
          table_id_(std::move(table_id)), revision_id_(revision_id) {}

    ~PgOptimizationSession() override {
        if (ended_) return;
        try {
            keeper_.finish_optimization(table_id_, revision_id_, id(), {});
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to release optimization session ", id(), ": ", e.what());
        }
    }

    void end(const std::set<std::string>& replicated_cubes) override {
        if (ended_) return;
        keeper_.finish_optimization(table_id_, revision_id_, id(), replicated_cubes);
        ended_ = true;
    }

private:
    PgKeeper& keeper_;
    std::string table_id_;
    RevisionID revision_id_;
    bool ended_ = false;
};

PgKeeper::PgKeeper(const db::ConnectionConfig& config) : conn_(config) {
    if (!conn_.ok()) {
        throw DatabaseError(std::string("Failed to connect: ") + conn_.error(),
                            "host=" + config.host + " dbname=" + config.dbname,
                            "Check the db.* settings or OTREE_DB_* variables");
    }
    ensure_schema();
    LOG_INFO("PostgreSQL keeper connected to ", config.host, "/", config.dbname);
}

PgKeeper::~PgKeeper() = default;

PGconn* PgKeeper::connection() {
    if (!conn_.ok()) {
        throw KeeperError("PostgreSQL keeper is not connected");
    }
    return conn_.get();
}

void PgKeeper::ensure_schema() {
    db::exec_checked(connection(), SCHEMA_SQL);
}

std::unique_ptr<WriteSession> PgKeeper::begin_write(const std::string& table_id, RevisionID revision_id) {
    std::set<std::string> announced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        db::Result res = db::exec_checked(
            connection(),
            "SELECT cube FROM otree_keeper_announced WHERE table_id = $1 AND revision_id = $2",
            {table_id, std::to_string(revision_id)});
        for (int i = 0; i < res.ntuples(); ++i) {
            announced.insert(res.str(i, 0));
        }
    }
    return std::make_unique<PgWriteSession>(new_session_id(), std::move(announced));
}

void PgKeeper::announce(const std::string& table_id, RevisionID revision_id,
                        const std::vector<std::string>& cubes) {
    if (cubes.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    PGconn* conn = connection();
    db::Transaction tx(conn);
    const std::string revision = std::to_string(revision_id);
    for (const std::string& cube : cubes) {
        db::exec_checked(conn,
                         "INSERT INTO otree_keeper_announced (table_id, revision_id, cube) "
                         "VALUES ($1, $2, $3) ON CONFLICT DO NOTHING",
                         {table_id, revision, cube});
    }
    tx.commit();
    LOG_DEBUG("Announced ", cubes.size(), " cubes of '", table_id, "' revision ", revision_id);
}

std::unique_ptr<OptimizationSession> PgKeeper::begin_optimization(const std::string& table_id,
                                                                  RevisionID revision_id,
                                                                  size_t cube_limit) {
    const std::string session_id = new_session_id();
    std::vector<std::string> cubes;
    if (cube_limit > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        PGconn* conn = connection();
        const std::string revision = std::to_string(revision_id);

        db::Transaction tx(conn);
        db::Result candidates = db::exec_checked(conn, CANDIDATES_SQL,
                                                 {table_id, revision, std::to_string(cube_limit)});
        for (int i = 0; i < candidates.ntuples(); ++i) {
            std::string cube = candidates.str(i, 0);
            db::Result inserted = db::exec_checked(
                conn,
                "INSERT INTO otree_keeper_reserved (table_id, revision_id, cube, session_id) "
                "VALUES ($1, $2, $3, $4) ON CONFLICT DO NOTHING RETURNING cube",
                {table_id, revision, cube, session_id});
            if (inserted.ntuples() == 1) {
                cubes.push_back(std::move(cube));
            }
        }
        tx.commit();
    }

    LOG_INFO("Optimization session ", session_id, " on '", table_id, "' revision ", revision_id,
             " reserved ", cubes.size(), " cubes");
    return std::make_unique<PgOptimizationSession>(*this, table_id, revision_id, session_id, std::move(cubes));
}

void PgKeeper::finish_optimization(const std::string& table_id, RevisionID revision_id,
                                   const std::string& session_id,
                                   const std::set<std::string>& replicated_cubes) {
    std::lock_guard<std::mutex> lock(mutex_);
    PGconn* conn = connection();
    const std::string revision = std::to_string(revision_id);

    db::Transaction tx(conn);
    for (const std::string& cube : replicated_cubes) {
        db::exec_checked(conn,
                         "INSERT INTO otree_keeper_replicated (table_id, revision_id, cube) "
                         "SELECT table_id, revision_id, cube FROM otree_keeper_reserved "
                         "WHERE table_id = $1 AND revision_id = $2 AND cube = $3 AND session_id = $4 "
                         "ON CONFLICT DO NOTHING",
                         {table_id, revision, cube, session_id});
    }
    db::exec_checked(conn, "DELETE FROM otree_keeper_reserved WHERE session_id = $1", {session_id});
    tx.commit();
}

void PgKeeper::clear(const std::string& table_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    PGconn* conn = connection();
    db::Transaction tx(conn);
    for (const char* table : {"otree_keeper_announced", "otree_keeper_replicated", "otree_keeper_reserved"}) {
        db::exec_checked(conn, std::string("DELETE FROM ") + table + " WHERE table_id = $1", {table_id});
    }
    tx.commit();
}

void PgKeeper::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    conn_.close();
}

} // namespace otree
