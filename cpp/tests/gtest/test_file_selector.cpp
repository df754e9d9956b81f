// =============================================================================
// File Selection Tests
// =============================================================================

#include <gtest/gtest.h>
#include "otree/error.hpp"
#include "otree/io/memory_store.hpp"
#include "otree/keeper/local_keeper.hpp"
#include "otree/query/file_selector.hpp"
#include "otree/row_hash.hpp"
#include "otree/writer/table_writer.hpp"

#include <algorithm>
#include <random>

using namespace otree;

class FileSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        revision = Revision::create("t", 1, 10,
                                    {Transformer("x", QDataType::Double, TransformerKind::Linear),
                                     Transformer("y", QDataType::Double, TransformerKind::Linear)},
                                    {ColumnStats::with_bounds("x", QDataType::Double, 0.0, 1.0),
                                     ColumnStats::with_bounds("y", QDataType::Double, 0.0, 1.0)});
        const CubeId root = revision.root();

        files.push_back(file("f_root", 1, {Block{root, at(0.0), at(0.3), 10, false}}));
        files.push_back(file("f_child", 1, {Block{root.child(0), at(0.31), Weight::MaxValue, 5, false}}));
        files.push_back(file("f_upper", 1, {Block{root.child(3), at(0.35), Weight::MaxValue, 5, false}}));
        files.push_back(file("f_copy", 1, {Block{root.child(1), at(0.1), Weight::MaxValue, 3, true}}));
        files.push_back(file("f_old", 7, {Block{root, at(0.0), Weight::MaxValue, 10, false}}));

        status = IndexStatus::from_files(revision, files);
    }

    static Weight at(double fraction) { return Weight::from_fraction(fraction); }

    static IndexFile file(const std::string& path, RevisionID revision_id, std::vector<Block> blocks) {
        IndexFile f;
        f.path = path;
        f.revision_id = revision_id;
        f.blocks = std::move(blocks);
        return f;
    }

    static std::set<std::string> as_set(const std::vector<std::string>& v) {
        return std::set<std::string>(v.begin(), v.end());
    }

    Revision revision;
    std::vector<IndexFile> files;
    IndexStatus status;
};

TEST_F(FileSelectorTest, SmallSampleReadsRootOnly) {
    FileSelector selector(status, files);
    EXPECT_EQ(selector.select(0.0, 0.2), std::vector<std::string>{"f_root"});
}

TEST_F(FileSelectorTest, DescendsBelowFullCubes) {
    FileSelector selector(status, files);
    EXPECT_EQ(as_set(selector.select(0.0, 0.5)), (std::set<std::string>{"f_root", "f_child", "f_upper"}));
    EXPECT_EQ(as_set(selector.select(0.0, 1.0)), (std::set<std::string>{"f_root", "f_child", "f_upper"}));
}

TEST_F(FileSelectorTest, LowerBoundSkipsExhaustedCubes) {
    FileSelector selector(status, files);
    EXPECT_EQ(as_set(selector.select(0.4, 1.0)), (std::set<std::string>{"f_child", "f_upper"}));
}

TEST_F(FileSelectorTest, ReplicatedBlocksNeverSelected) {
    FileSelector selector(status, files);
    std::vector<std::string> all = selector.select(0.0, 1.0);
    EXPECT_EQ(std::count(all.begin(), all.end(), "f_copy"), 0);
    EXPECT_EQ(std::count(all.begin(), all.end(), "f_old"), 0);
    EXPECT_TRUE(status.replicated_set.contains(revision.root()));
}

TEST_F(FileSelectorTest, FiltersPruneCubes) {
    FileSelector selector(status, files);

    std::vector<ColumnFilter> left = {{"x", 0.0, 0.4}};
    EXPECT_EQ(as_set(selector.select(0.0, 1.0, left)), (std::set<std::string>{"f_root", "f_child"}));

    std::vector<ColumnFilter> right = {{"x", 0.6, 0.9}};
    EXPECT_EQ(as_set(selector.select(0.0, 1.0, right)), (std::set<std::string>{"f_root", "f_upper"}));

    std::vector<ColumnFilter> empty = {{"x", 0.9, 0.1}};
    EXPECT_TRUE(selector.select(0.0, 1.0, empty).empty());

    std::vector<ColumnFilter> open_below = {{"x", ColumnValue{}, 0.4}};
    EXPECT_EQ(as_set(selector.select(0.0, 1.0, open_below)), (std::set<std::string>{"f_root", "f_child"}));

    std::vector<ColumnFilter> open_above = {{"x", 0.6, ColumnValue{}}};
    EXPECT_EQ(as_set(selector.select(0.0, 1.0, open_above)), (std::set<std::string>{"f_root", "f_upper"}));

    std::vector<ColumnFilter> unknown = {{"z", 0.0, 1.0}};
    EXPECT_THROW(selector.select(0.0, 1.0, unknown), InvalidArgumentError);
}

TEST_F(FileSelectorTest, InvalidRangesRejected) {
    FileSelector selector(status, files);
    EXPECT_THROW(selector.select(0.5, 0.2), InvalidArgumentError);
    EXPECT_THROW(selector.select(-0.1, 0.5), InvalidArgumentError);
    EXPECT_THROW(selector.select(0.0, 1.5), InvalidArgumentError);
}

// Every row with weight under the sample bound lives in a selected file
TEST_F(FileSelectorTest, SampleCoversWrittenRows) {
    InMemoryCommitLog log;
    LocalKeeper keeper;
    MemoryFileStore store;

    IndexOptions options;
    options.desired_cube_size = 40;
    options.max_depth = 16;
    options.worker_threads = 2;
    TableWriter writer("sampled", log, keeper, store, options, 3);

    RowBatch batch;
    batch.schema = Schema(std::vector<Field>{{"x", QDataType::Double}, {"y", QDataType::Double}});
    std::mt19937 rng(17);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    for (int i = 0; i < 1000; ++i) {
        batch.rows.push_back({dist(rng), dist(rng)});
    }
    writer.write(batch, {"x", "y"});

    TableSnapshot snapshot = log.snapshot("sampled");
    const Revision& rev = snapshot.revisions.back();
    IndexStatus written = IndexStatus::from_files(rev, snapshot.files);
    FileSelector selector(written, snapshot.files);

    EXPECT_EQ(selector.select(0.0, 1.0).size(), snapshot.files.size());

    const double fraction = 0.1;
    const Weight upper = Weight::from_fraction(fraction);
    const std::set<std::string> selected = as_set(selector.select(0.0, fraction));
    EXPECT_LT(selected.size(), snapshot.files.size());

    const auto columns = rev.column_indices(snapshot.schema);
    for (const IndexFile& f : snapshot.files) {
        if (selected.contains(f.path)) continue;
        for (const Row& row : store.rows(f.path)) {
            EXPECT_GE(row_weight(row, snapshot.schema, columns), upper) << "row missed in " << f.path;
        }
    }
}
