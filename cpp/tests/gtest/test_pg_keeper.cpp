// =============================================================================
// PostgreSQL Keeper Tests
// =============================================================================
//
// Needs a reachable database (db.* settings or OTREE_DB_* variables).
// Every test skips when no connection can be made.

#include <gtest/gtest.h>
#include "otree/error.hpp"
#include "otree/keeper/pg_keeper.hpp"

#include <memory>

using namespace otree;

class PgKeeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            keeper = std::make_unique<PgKeeper>();
        } catch (const OTreeException& e) {
            GTEST_SKIP() << "Database connection failed: " << e.what();
        }
        table = "otree_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name();
        keeper->clear(table);

        CubeId root = CubeId::root(2);
        for (const CubeId& child : root.children()) {
            cubes.push_back(child.to_string());
            cubes.push_back(child.child(1).to_string());
        }
    }

    void TearDown() override {
        if (keeper) {
            keeper->clear(table);
            keeper->stop();
        }
    }

    std::unique_ptr<PgKeeper> keeper;
    std::string table;
    std::vector<std::string> cubes;  // 8 cubes
};

TEST_F(PgKeeperTest, AnnounceAndBeginWrite) {
    keeper->announce(table, 1, {cubes[0], cubes[1]});
    keeper->announce(table, 1, {cubes[1], cubes[2]});

    auto session = keeper->begin_write(table, 1);
    EXPECT_EQ(session->announced_cubes(), (std::set<std::string>{cubes[0], cubes[1], cubes[2]}));
    session->end();

    EXPECT_TRUE(keeper->begin_write(table, 2)->announced_cubes().empty());
}

TEST_F(PgKeeperTest, ReservationsAreDisjoint) {
    keeper->announce(table, 1, cubes);

    auto first = keeper->begin_optimization(table, 1, 5);
    auto second = keeper->begin_optimization(table, 1, 5);
    auto third = keeper->begin_optimization(table, 1, 5);

    EXPECT_EQ(first->cubes_to_optimize().size(), 5u);
    EXPECT_EQ(second->cubes_to_optimize().size(), 3u);
    EXPECT_TRUE(third->cubes_to_optimize().empty());

    std::set<std::string> all(first->cubes_to_optimize().begin(), first->cubes_to_optimize().end());
    for (const std::string& cube : second->cubes_to_optimize()) {
        EXPECT_TRUE(all.insert(cube).second) << "cube " << cube << " reserved twice";
    }
    EXPECT_EQ(all.size(), cubes.size());
}

TEST_F(PgKeeperTest, EndRecordsReplicated) {
    keeper->announce(table, 1, cubes);

    auto session = keeper->begin_optimization(table, 1, 8);
    ASSERT_EQ(session->cubes_to_optimize().size(), 8u);
    const std::string done = session->cubes_to_optimize()[0];
    session->end({done});

    auto next = keeper->begin_optimization(table, 1, 8);
    EXPECT_EQ(next->cubes_to_optimize().size(), 7u);
    for (const std::string& cube : next->cubes_to_optimize()) {
        EXPECT_NE(cube, done);
    }
}

TEST_F(PgKeeperTest, DestroyedSessionReleasesReservation) {
    keeper->announce(table, 1, cubes);
    {
        auto session = keeper->begin_optimization(table, 1, 8);
        EXPECT_EQ(session->cubes_to_optimize().size(), 8u);
    }
    auto again = keeper->begin_optimization(table, 1, 8);
    EXPECT_EQ(again->cubes_to_optimize().size(), 8u);
}
