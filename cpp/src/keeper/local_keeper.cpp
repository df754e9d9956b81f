#include "otree/keeper/local_keeper.hpp"
#include "otree/logging.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace otree {

namespace {

std::string new_session_id() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

class LocalWriteSession : public WriteSession {
public:
    using WriteSession::WriteSession;

    void end() override {
        LOG_DEBUG("Write session ", id(), " ended");
    }
};

} // anonymous namespace

class LocalOptimizationSession : public OptimizationSession {
public:
    LocalOptimizationSession(LocalKeeper& keeper, LocalKeeper::Key key, std::string id,
                             std::vector<std::string> cubes)
        : OptimizationSession(std::move(id), std::move(cubes)), keeper_(keeper), key_(std::move(key)) {}

    ~LocalOptimizationSession() override {
        if (!ended_) {
            keeper_.finish_optimization(key_, id(), {});
        }
    }

    void end(const std::set<std::string>& replicated_cubes) override {
        if (ended_) return;
        keeper_.finish_optimization(key_, id(), replicated_cubes);
        ended_ = true;
    }

private:
    LocalKeeper& keeper_;
    LocalKeeper::Key key_;
    bool ended_ = false;
};

std::unique_ptr<WriteSession> LocalKeeper::begin_write(const std::string& table_id, RevisionID revision_id) {
    std::set<std::string> announced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find({table_id, revision_id});
        if (it != tables_.end()) {
            announced = it->second.announced;
        }
    }
    auto session = std::make_unique<LocalWriteSession>(new_session_id(), std::move(announced));
    LOG_DEBUG("Write session ", session->id(), " on '", table_id, "' revision ", revision_id,
              " sees ", session->announced_cubes().size(), " announced cubes");
    return session;
}

void LocalKeeper::announce(const std::string& table_id, RevisionID revision_id,
                           const std::vector<std::string>& cubes) {
    std::lock_guard<std::mutex> lock(mutex_);
    TableState& state = tables_[{table_id, revision_id}];
    state.announced.insert(cubes.begin(), cubes.end());
}

std::unique_ptr<OptimizationSession> LocalKeeper::begin_optimization(const std::string& table_id,
                                                                     RevisionID revision_id,
                                                                     size_t cube_limit) {
    Key key{table_id, revision_id};
    const std::string session_id = new_session_id();
    std::vector<std::string> cubes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TableState& state = tables_[key];

        std::set<std::string> unavailable = state.replicated;
        for (const auto& [other, reserved] : state.reserved) {
            unavailable.insert(reserved.begin(), reserved.end());
        }
        for (const std::string& cube : state.announced) {
            if (cubes.size() >= cube_limit) break;
            if (!unavailable.contains(cube)) {
                cubes.push_back(cube);
            }
        }
        state.reserved[session_id] = std::set<std::string>(cubes.begin(), cubes.end());
    }

    LOG_INFO("Optimization session ", session_id, " on '", table_id, "' revision ", revision_id,
             " reserved ", cubes.size(), " cubes");
    return std::make_unique<LocalOptimizationSession>(*this, std::move(key), session_id, std::move(cubes));
}

void LocalKeeper::finish_optimization(const Key& key, const std::string& session_id,
                                      const std::set<std::string>& replicated_cubes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto table = tables_.find(key);
    if (table == tables_.end()) return;

    TableState& state = table->second;
    auto reservation = state.reserved.find(session_id);
    if (reservation == state.reserved.end()) return;

    for (const std::string& cube : replicated_cubes) {
        if (reservation->second.contains(cube)) {
            state.replicated.insert(cube);
        }
    }
    state.reserved.erase(reservation);
}

std::set<std::string> LocalKeeper::announced(const std::string& table_id, RevisionID revision_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find({table_id, revision_id});
    return it == tables_.end() ? std::set<std::string>{} : it->second.announced;
}

std::set<std::string> LocalKeeper::replicated(const std::string& table_id, RevisionID revision_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find({table_id, revision_id});
    return it == tables_.end() ? std::set<std::string>{} : it->second.replicated;
}

} // namespace otree
