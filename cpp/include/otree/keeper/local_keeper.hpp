#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "otree/keeper/keeper.hpp"

namespace otree {

/**
 * In-memory keeper for a single process. State lives per (table, revision)
 * and is lost with the object; independent processes do not see each other.
 */
class LocalKeeper : public Keeper {
public:
    std::unique_ptr<WriteSession> begin_write(const std::string& table_id, RevisionID revision_id) override;

    void announce(const std::string& table_id, RevisionID revision_id,
                  const std::vector<std::string>& cubes) override;

    std::unique_ptr<OptimizationSession> begin_optimization(const std::string& table_id,
                                                            RevisionID revision_id,
                                                            size_t cube_limit) override;

    void stop() override {}

    std::set<std::string> announced(const std::string& table_id, RevisionID revision_id) const;
    std::set<std::string> replicated(const std::string& table_id, RevisionID revision_id) const;

private:
    friend class LocalOptimizationSession;

    struct TableState {
        std::set<std::string> announced;
        std::set<std::string> replicated;
        std::map<std::string, std::set<std::string>> reserved;  // session id -> cubes
    };

    using Key = std::pair<std::string, RevisionID>;

    void finish_optimization(const Key& key, const std::string& session_id,
                             const std::set<std::string>& replicated_cubes);

    mutable std::mutex mutex_;
    std::map<Key, TableState> tables_;
};

} // namespace otree
