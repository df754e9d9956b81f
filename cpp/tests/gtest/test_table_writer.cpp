// =============================================================================
// Write Path and Optimizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "otree/error.hpp"
#include "otree/io/memory_store.hpp"
#include "otree/keeper/local_keeper.hpp"
#include "otree/writer/table_optimizer.hpp"
#include "otree/writer/table_writer.hpp"

#include <functional>
#include <random>

using namespace otree;

namespace {

// Commit log that can run a one-shot hook before forwarding a commit
class InterceptingCommitLog : public CommitLog {
public:
    explicit InterceptingCommitLog(CommitLog& inner) : inner_(inner) {}

    TableSnapshot snapshot(const std::string& table_id) override { return inner_.snapshot(table_id); }

    CommitStatus commit(const CommitRequest& request) override {
        ++commits;
        if (before_next_commit) {
            auto hook = std::move(before_next_commit);
            before_next_commit = nullptr;
            hook();
        }
        if (always_conflict) {
            return CommitStatus::Conflict;
        }
        return inner_.commit(request);
    }

    std::function<void()> before_next_commit;
    bool always_conflict = false;
    int commits = 0;

private:
    CommitLog& inner_;
};

} // anonymous namespace

class TableWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema = Schema(std::vector<Field>{{"id", QDataType::Long}, {"x", QDataType::Double}, {"y", QDataType::Double}});
        options.desired_cube_size = 50;
        options.max_depth = 16;
        options.worker_threads = 2;
        options.column_stats = {
            ColumnStats::with_bounds("x", QDataType::Double, 0.0, 1.0),
            ColumnStats::with_bounds("y", QDataType::Double, 0.0, 1.0),
        };
    }

    RowBatch make_batch(size_t n, uint32_t seed, int64_t first_id = 0) const {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        RowBatch batch;
        batch.schema = schema;
        for (size_t i = 0; i < n; ++i) {
            batch.rows.push_back({first_id + static_cast<int64_t>(i), dist(rng), dist(rng)});
        }
        return batch;
    }

    static int64_t total_rows(const std::vector<IndexFile>& files) {
        int64_t total = 0;
        for (const IndexFile& file : files) total += file.element_count();
        return total;
    }

    // Every stored row sits in a block of the cube containing it
    void expect_consistent_layout(const TableSnapshot& snapshot) {
        for (const IndexFile& file : snapshot.files) {
            ASSERT_TRUE(store.contains(file.path)) << file.path;
            EXPECT_EQ(static_cast<int64_t>(store.rows(file.path).size()), file.element_count());

            const Revision* revision = snapshot.revision(file.revision_id);
            ASSERT_NE(revision, nullptr);
            const auto columns = revision->column_indices(snapshot.schema);
            for (size_t b = 0; b < file.blocks.size(); ++b) {
                const Block& block = file.blocks[b];
                if (b > 0) {
                    EXPECT_LT(file.blocks[b - 1].cube, block.cube);
                }
                for (const Row& row : store.read_block(file, b)) {
                    Point p = revision->transform(row, columns);
                    EXPECT_EQ(CubeId::container(p, block.cube.depth()), block.cube);
                }
            }
        }
    }

    Schema schema;
    IndexOptions options;
    InMemoryCommitLog log;
    LocalKeeper keeper;
    MemoryFileStore store;
};

TEST_F(TableWriterTest, FirstWriteCreatesRevision) {
    TableWriter writer("t", log, keeper, store, options, 3);
    RowBatch batch = make_batch(500, 1);
    WriteResult result = writer.write(batch, {"x", "y"});

    EXPECT_EQ(result.revision_id, 1);
    EXPECT_TRUE(result.new_revision);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(result.files.empty());
    EXPECT_EQ(total_rows(result.files), 500);

    TableSnapshot snapshot = log.snapshot("t");
    EXPECT_EQ(snapshot.version, 1);
    ASSERT_EQ(snapshot.revisions.size(), 1u);
    EXPECT_EQ(snapshot.revisions[0].desired_cube_size, 50);
    EXPECT_EQ(snapshot.files, result.files);
    EXPECT_EQ(store.file_count(), result.files.size());
    for (const IndexFile& file : snapshot.files) {
        EXPECT_TRUE(file.data_change);
        EXPECT_EQ(file.revision_id, 1);
        EXPECT_GT(file.size, 0);
    }
    expect_consistent_layout(snapshot);

    // Cubes that filled up are announced to the keeper
    EXPECT_TRUE(keeper.announced("t", 1).contains(""));
    EXPECT_EQ(keeper.announced("t", 1), std::set<std::string>(result.announced.begin(), result.announced.end()));
}

TEST_F(TableWriterTest, AppendKeepsAnnouncedThresholds) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(500, 1), {"x", "y"});
    TableSnapshot before = log.snapshot("t");
    IndexStatus prior = IndexStatus::from_files(before.revisions[0], before.files);

    WriteResult second = writer.write(make_batch(300, 2, 1000), {"x", "y"});
    EXPECT_EQ(second.revision_id, 1);
    EXPECT_FALSE(second.new_revision);

    TableSnapshot after = log.snapshot("t");
    EXPECT_EQ(after.revisions.size(), 1u);
    EXPECT_EQ(total_rows(after.files), 800);
    expect_consistent_layout(after);

    const CubeId root = after.revisions[0].root();
    for (const IndexFile& file : second.files) {
        for (const Block& block : file.blocks) {
            if (block.cube == root) {
                EXPECT_EQ(block.max_weight, prior.max_weight(root));
                EXPECT_LE(block.min_weight, block.max_weight);
            }
        }
    }
    IndexStatus status = IndexStatus::from_files(after.revisions[0], after.files);
    EXPECT_EQ(status.max_weight(root), prior.max_weight(root));
}

TEST_F(TableWriterTest, OutOfBoundsAppendCreatesRevision) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(200, 1), {"x", "y"});

    RowBatch wide = make_batch(200, 2, 1000);
    wide.rows[3][1] = 4.0;
    WriteResult result = writer.write(wide, {"x", "y"});
    EXPECT_EQ(result.revision_id, 2);
    EXPECT_TRUE(result.new_revision);

    TableSnapshot snapshot = log.snapshot("t");
    ASSERT_EQ(snapshot.revisions.size(), 2u);
    EXPECT_DOUBLE_EQ(snapshot.revisions[1].transformations[0].linear()->max, 4.0);
    EXPECT_EQ(total_rows(snapshot.files_of(1)), 200);
    EXPECT_EQ(total_rows(snapshot.files_of(2)), 200);
    expect_consistent_layout(snapshot);
}

TEST_F(TableWriterTest, ChangedColumnsCreateRevision) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(100, 1), {"x", "y"});
    WriteResult result = writer.write(make_batch(100, 2, 1000), {"y"});
    EXPECT_EQ(result.revision_id, 2);
    EXPECT_TRUE(result.new_revision);
    EXPECT_EQ(log.snapshot("t").revisions[1].indexed_columns(), std::vector<std::string>{"y"});
}

TEST_F(TableWriterTest, OverwriteTombstonesEveryFile) {
    TableWriter writer("t", log, keeper, store, options, 3);
    WriteResult first = writer.write(make_batch(300, 1), {"x", "y"});
    WriteResult second = writer.write(make_batch(100, 2, 1000), {"x", "y"}, WriteMode::Overwrite);

    EXPECT_EQ(second.revision_id, 2);
    TableSnapshot snapshot = log.snapshot("t");
    EXPECT_EQ(snapshot.files, second.files);
    EXPECT_EQ(total_rows(snapshot.files), 100);

    std::vector<DeleteFile> tombstones = log.tombstones("t");
    ASSERT_EQ(tombstones.size(), first.files.size());
    for (size_t i = 0; i < tombstones.size(); ++i) {
        EXPECT_EQ(tombstones[i].path, first.files[i].path);
        EXPECT_EQ(tombstones[i].size, first.files[i].size);
        EXPECT_TRUE(tombstones[i].data_change);
    }
}

TEST_F(TableWriterTest, SchemaMismatchRejected) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(50, 1), {"x", "y"});

    RowBatch other;
    other.schema = Schema(std::vector<Field>{{"x", QDataType::Double}, {"y", QDataType::Double}});
    other.rows = {{0.5, 0.5}};
    EXPECT_THROW(writer.write(other, {"x", "y"}), InvalidArgumentError);
    EXPECT_THROW(writer.write(make_batch(10, 2), {}), InvalidArgumentError);
}

// A concurrent commit between snapshot and commit forces one retry
TEST_F(TableWriterTest, ConflictRetriesFromFreshSnapshot) {
    InterceptingCommitLog racing(log);
    TableWriter interloper("t", log, keeper, store, options, 0);
    racing.before_next_commit = [&]() {
        interloper.write(make_batch(200, 9, 5000), {"x", "y"});
    };

    TableWriter writer("t", racing, keeper, store, options, 3);
    WriteResult result = writer.write(make_batch(300, 1), {"x", "y"});

    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(racing.commits, 2);
    EXPECT_EQ(result.revision_id, 1);
    EXPECT_FALSE(result.new_revision);

    TableSnapshot snapshot = log.snapshot("t");
    EXPECT_EQ(snapshot.version, 2);
    EXPECT_EQ(total_rows(snapshot.files), 500);
    // Files of the failed attempt were dropped
    EXPECT_EQ(store.file_count(), snapshot.files.size());
    expect_consistent_layout(snapshot);
}

TEST_F(TableWriterTest, GivesUpAfterRetries) {
    InterceptingCommitLog racing(log);
    racing.always_conflict = true;

    TableWriter writer("t", racing, keeper, store, options, 2);
    EXPECT_THROW(writer.write(make_batch(100, 1), {"x", "y"}), CommitConflictError);
    EXPECT_EQ(racing.commits, 3);
    EXPECT_EQ(store.file_count(), 0u);
    EXPECT_TRUE(log.snapshot("t").empty());
    EXPECT_TRUE(keeper.announced("t", 1).empty());
}

TEST_F(TableWriterTest, WriteIndexFilesOneBlockPerCube) {
    OTreeAlgorithm algorithm(options);
    RowBatch batch = make_batch(400, 4);
    Revision revision = algorithm.bootstrap_revision("t", 1, batch, {"x", "y"});
    IndexResult result = algorithm.index_first(batch, revision);
    RollupPlan plan = RollupPlan::create(compute_rollup(result.changes));

    std::vector<IndexFile> files = write_index_files(batch, result, plan, store, false);
    EXPECT_EQ(files.size(), plan.group_count());
    EXPECT_EQ(total_rows(files), 400);

    std::set<CubeId> seen;
    for (const IndexFile& file : files) {
        EXPECT_FALSE(file.data_change);
        for (const Block& block : file.blocks) {
            EXPECT_TRUE(seen.insert(block.cube).second);
            EXPECT_EQ(plan.file_for(block.cube), file.path);
            EXPECT_TRUE(file.has_cube_data(block.cube));
            EXPECT_EQ(block.element_count, result.changes.input_block_element_counts.at(block.cube));
            EXPECT_EQ(block.max_weight, result.changes.cube_max_weight(block.cube));
        }
    }

    discard_files(store, files);
    EXPECT_EQ(store.file_count(), 0u);
}

TEST_F(TableWriterTest, OptimizerReplicatesAnnouncedCubes) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(600, 1), {"x", "y"});
    const std::set<std::string> announced = keeper.announced("t", 1);
    ASSERT_FALSE(announced.empty());

    TableSnapshot before = log.snapshot("t");
    IndexStatus status = IndexStatus::from_files(before.revisions[0], before.files);
    int64_t expected_rows = 0;
    for (const std::string& cube : announced) {
        expected_rows += status.element_count(before.revisions[0].create_cube_id(std::string_view(cube)));
    }

    TableOptimizer optimizer("t", log, keeper, store, store, options, 3);
    OptimizeResult result = optimizer.optimize(1, announced.size());

    EXPECT_EQ(std::set<std::string>(result.replicated.begin(), result.replicated.end()), announced);
    EXPECT_EQ(keeper.replicated("t", 1), announced);
    EXPECT_EQ(result.replicated_rows, expected_rows);
    EXPECT_EQ(total_rows(result.files), expected_rows);

    const std::set<CubeId> origins = parse_cubes(before.revisions[0], announced);
    for (const IndexFile& file : result.files) {
        EXPECT_FALSE(file.data_change);
        for (const Block& block : file.blocks) {
            EXPECT_TRUE(block.replicated);
            ASSERT_TRUE(block.cube.parent().has_value());
            EXPECT_TRUE(origins.contains(*block.cube.parent()));
        }
    }

    // Original rows stay where they were
    TableSnapshot after = log.snapshot("t");
    EXPECT_EQ(total_rows(after.files), 600 + expected_rows);
    IndexStatus replicated = IndexStatus::from_files(after.revisions[0], after.files);
    EXPECT_EQ(replicated.replicated_set, origins);
    expect_consistent_layout(after);

    // Nothing left to optimize
    OptimizeResult again = optimizer.optimize(1, 100);
    EXPECT_TRUE(again.replicated.empty());
    EXPECT_TRUE(again.files.empty());
}

TEST_F(TableWriterTest, OptimizerRespectsCubeLimit) {
    TableWriter writer("t", log, keeper, store, options, 3);
    writer.write(make_batch(600, 1), {"x", "y"});
    const size_t announced = keeper.announced("t", 1).size();
    ASSERT_GT(announced, 1u);

    TableOptimizer optimizer("t", log, keeper, store, store, options, 3);
    OptimizeResult first = optimizer.optimize(1, 1);
    EXPECT_EQ(first.replicated.size(), 1u);
    EXPECT_EQ(keeper.replicated("t", 1).size(), 1u);

    OptimizeResult rest = optimizer.optimize(1, announced);
    EXPECT_EQ(rest.replicated.size(), announced - 1);
    EXPECT_EQ(keeper.replicated("t", 1).size(), announced);
}
