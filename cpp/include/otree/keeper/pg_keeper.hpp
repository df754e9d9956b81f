#pragma once

#include <mutex>
#include <string>

#include "otree/db/connection.hpp"
#include "otree/keeper/keeper.hpp"

namespace otree {

/**
 * Keeper shared by several processes through PostgreSQL.
 *
 * Tables (created on connect when missing):
 *   otree_keeper_announced   (table_id, revision_id, cube)
 *   otree_keeper_replicated  (table_id, revision_id, cube)
 *   otree_keeper_reserved    (table_id, revision_id, cube, session_id)
 *
 * Reservations are taken in one transaction that locks the candidate rows
 * with FOR UPDATE SKIP LOCKED, so concurrent optimizers get disjoint cubes.
 * One connection per keeper, serialized by a mutex.
 */
class PgKeeper : public Keeper {
public:
    explicit PgKeeper(const db::ConnectionConfig& config = db::ConnectionConfig());
    ~PgKeeper() override;

    std::unique_ptr<WriteSession> begin_write(const std::string& table_id, RevisionID revision_id) override;

    void announce(const std::string& table_id, RevisionID revision_id,
                  const std::vector<std::string>& cubes) override;

    std::unique_ptr<OptimizationSession> begin_optimization(const std::string& table_id,
                                                            RevisionID revision_id,
                                                            size_t cube_limit) override;

    void stop() override;

    // Remove every keeper row of a table (tests and table drops)
    void clear(const std::string& table_id);

private:
    friend class PgOptimizationSession;

    void ensure_schema();
    void finish_optimization(const std::string& table_id, RevisionID revision_id,
                             const std::string& session_id, const std::set<std::string>& replicated_cubes);
    PGconn* connection();

    std::mutex mutex_;
    db::Connection conn_;
};

} // namespace otree
