// =============================================================================
// Local Keeper Tests
// =============================================================================

#include <gtest/gtest.h>
#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/keeper/local_keeper.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

using namespace otree;

class LocalKeeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        CubeId root = CubeId::root(2);
        for (const CubeId& child : root.children()) {
            cubes.push_back(child.to_string());
            cubes.push_back(child.child(0).to_string());
        }
        std::sort(cubes.begin(), cubes.end());
    }

    static std::set<std::string> as_set(const std::vector<std::string>& v) {
        return std::set<std::string>(v.begin(), v.end());
    }

    LocalKeeper keeper;
    std::vector<std::string> cubes;  // 8 cubes, sorted
};

TEST_F(LocalKeeperTest, AnnouncementIsMonotonic) {
    keeper.announce("t", 1, {cubes[0], cubes[1]});
    keeper.announce("t", 1, {cubes[1], cubes[2]});
    keeper.announce("t", 1, {});

    EXPECT_EQ(keeper.announced("t", 1), (std::set<std::string>{cubes[0], cubes[1], cubes[2]}));

    auto session = keeper.begin_write("t", 1);
    EXPECT_EQ(session->announced_cubes(), keeper.announced("t", 1));
    EXPECT_FALSE(session->id().empty());
    session->end();

    // Revisions and tables are independent
    EXPECT_TRUE(keeper.announced("t", 2).empty());
    EXPECT_TRUE(keeper.begin_write("other", 1)->announced_cubes().empty());
}

TEST_F(LocalKeeperTest, WriteSessionIsASnapshot) {
    keeper.announce("t", 1, {cubes[0]});
    auto session = keeper.begin_write("t", 1);
    keeper.announce("t", 1, {cubes[1]});
    EXPECT_EQ(session->announced_cubes().size(), 1u);
    session->end();
}

// 8 announced cubes, limit 5: sessions get 5, then 3, then nothing
TEST_F(LocalKeeperTest, OptimizationSessionsAreDisjoint) {
    keeper.announce("t", 1, cubes);

    auto first = keeper.begin_optimization("t", 1, 5);
    auto second = keeper.begin_optimization("t", 1, 5);
    auto third = keeper.begin_optimization("t", 1, 5);

    EXPECT_EQ(first->cubes_to_optimize().size(), 5u);
    EXPECT_EQ(second->cubes_to_optimize().size(), 3u);
    EXPECT_TRUE(third->cubes_to_optimize().empty());
    EXPECT_NE(first->id(), second->id());

    std::set<std::string> all = as_set(first->cubes_to_optimize());
    for (const std::string& cube : second->cubes_to_optimize()) {
        EXPECT_TRUE(all.insert(cube).second) << "cube " << cube << " reserved twice";
    }
    EXPECT_EQ(all, as_set(cubes));

    // Reservations follow the sorted cube order
    EXPECT_EQ(first->cubes_to_optimize(), std::vector<std::string>(cubes.begin(), cubes.begin() + 5));
}

TEST_F(LocalKeeperTest, EndRecordsReplicatedCubes) {
    keeper.announce("t", 1, cubes);

    auto session = keeper.begin_optimization("t", 1, 3);
    std::set<std::string> done = {session->cubes_to_optimize()[0], session->cubes_to_optimize()[1]};
    std::set<std::string> reported = done;
    reported.insert(cubes[7]);  // not reserved by this session
    session->end(reported);

    EXPECT_EQ(keeper.replicated("t", 1), done);

    // The unreplicated reserved cube is offered again, replicated ones never
    auto next = keeper.begin_optimization("t", 1, 10);
    std::set<std::string> offered = as_set(next->cubes_to_optimize());
    EXPECT_EQ(offered.size(), cubes.size() - done.size());
    for (const std::string& cube : done) {
        EXPECT_FALSE(offered.contains(cube));
    }
    EXPECT_TRUE(offered.contains(session->cubes_to_optimize()[2]));
}

TEST_F(LocalKeeperTest, DestroyedSessionReleasesReservation) {
    keeper.announce("t", 1, cubes);
    {
        auto session = keeper.begin_optimization("t", 1, 8);
        EXPECT_EQ(session->cubes_to_optimize().size(), 8u);
        EXPECT_TRUE(keeper.begin_optimization("t", 1, 8)->cubes_to_optimize().empty());
    }
    auto again = keeper.begin_optimization("t", 1, 8);
    EXPECT_EQ(again->cubes_to_optimize().size(), 8u);
    EXPECT_TRUE(keeper.replicated("t", 1).empty());
}

TEST_F(LocalKeeperTest, EndIsIdempotent) {
    keeper.announce("t", 1, cubes);
    auto session = keeper.begin_optimization("t", 1, 2);
    session->end(as_set(session->cubes_to_optimize()));
    session->end({});
    EXPECT_EQ(keeper.replicated("t", 1).size(), 2u);
}

TEST_F(LocalKeeperTest, ConcurrentOptimizersGetDisjointCubes) {
    std::vector<std::string> many;
    CubeId root = CubeId::root(3);
    for (const CubeId& child : root.children()) {
        for (const CubeId& grandchild : child.children()) {
            many.push_back(grandchild.to_string());
        }
    }
    keeper.announce("t", 1, many);

    std::mutex mutex;
    std::vector<std::unique_ptr<OptimizationSession>> sessions;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 4; ++i) {
                auto session = keeper.begin_optimization("t", 1, 3);
                std::lock_guard<std::mutex> lock(mutex);
                sessions.push_back(std::move(session));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> seen;
    size_t total = 0;
    for (const auto& session : sessions) {
        for (const std::string& cube : session->cubes_to_optimize()) {
            EXPECT_TRUE(seen.insert(cube).second) << "cube " << cube << " reserved twice";
            ++total;
        }
    }
    EXPECT_EQ(total, many.size());
}

TEST_F(LocalKeeperTest, CubeStringConversions) {
    Revision revision = Revision::create("t", 1, 10,
                                         {Transformer("x", QDataType::Double, TransformerKind::Linear),
                                          Transformer("y", QDataType::Double, TransformerKind::Linear)},
                                         {});
    std::set<CubeId> ids = {revision.root(), revision.root().child(1), revision.root().child(1).child(2)};
    std::vector<std::string> strings = cube_strings(ids);
    EXPECT_EQ(strings.size(), 3u);
    EXPECT_EQ(parse_cubes(revision, as_set(strings)), ids);
    EXPECT_THROW(parse_cubes(revision, {"?"}), CorruptDataError);
}

TEST_F(LocalKeeperTest, BackendFromConfig) {
    Config::getInstance().set("keeper.backend", "local");
    auto local = make_keeper();
    EXPECT_NE(dynamic_cast<LocalKeeper*>(local.get()), nullptr);

    Config::getInstance().set("keeper.backend", "zookeeper");
    EXPECT_THROW(make_keeper(), InvalidArgumentError);
    Config::getInstance().set("keeper.backend", "local");
}
