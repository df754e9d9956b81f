#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "otree/column_stats.hpp"
#include "otree/cube_id.hpp"
#include "otree/index_status.hpp"
#include "otree/revision.hpp"
#include "otree/table_changes.hpp"
#include "otree/thread_pool.hpp"
#include "otree/types.hpp"
#include "otree/weight.hpp"

namespace otree {

// Per-call indexing parameters
struct IndexOptions {
    int64_t desired_cube_size = 100000;
    uint32_t max_depth = 24;
    size_t worker_threads = 0;  // 0 = hardware concurrency
    // User supplied bounds seeding the first revision
    std::vector<ColumnStats> column_stats;

    // Options from index.* keys of the process configuration
    static IndexOptions from_config();
};

// Placement of one row of the input batch
struct IndexedRow {
    size_t row = 0;  // position in the batch
    CubeId cube;
    Weight weight;
    bool replicated = false;
};

struct IndexResult {
    std::vector<IndexedRow> rows;
    TableChanges changes;
    // Rows kept past the desired size because the cube sits at max depth
    int64_t overflowed_rows = 0;
};

/**
 * Weight-threshold estimator.
 *
 * Rows start at the root. At every level each cube ranks its rows by
 * (weight, row identity) and keeps as many as its remaining capacity allows;
 * the threshold becomes the weight of the last kept row and the rest move one
 * level down into the child containing them. Announced cubes keep their
 * committed threshold and accept every row below it. Cubes at max depth keep
 * everything.
 *
 * The result depends only on the set of rows and the prior state, never on
 * the order of the batch. Groups of one level are ranked concurrently on the
 * worker pool.
 */
class OTreeAlgorithm {
public:
    explicit OTreeAlgorithm(IndexOptions options = {});
    ~OTreeAlgorithm();

    OTreeAlgorithm(const OTreeAlgorithm&) = delete;
    OTreeAlgorithm& operator=(const OTreeAlgorithm&) = delete;

    const IndexOptions& options() const noexcept { return options_; }

    /**
     * Revision for the first write of `columns` ("name" or "name:kind"
     * specs) into a table. Bounds come from the batch, widened by
     * options().column_stats.
     */
    Revision bootstrap_revision(const std::string& table_id, RevisionID revision_id,
                                const RowBatch& batch, const std::vector<std::string>& columns) const;

    // Index a batch into a revision with no committed data
    IndexResult index_first(const RowBatch& batch, const Revision& revision) const;

    /**
     * Index a batch on top of committed state. When the batch falls outside
     * the revision bounds a widened revision (id + 1) is created and the
     * batch is indexed into it from scratch.
     */
    IndexResult index_next(const RowBatch& batch, const IndexStatus& status,
                           const std::set<CubeId>& announced) const;

    /**
     * Copy the rows of `origins[i]` (one entry per batch row) into the child
     * of that cube containing them. Used by the optimizer; origins at max
     * depth are left alone.
     */
    IndexResult replicate(const RowBatch& batch, const std::vector<CubeId>& origins,
                          const IndexStatus& status) const;

private:
    struct PreparedRows;

    PreparedRows prepare(const RowBatch& batch, const Revision& revision) const;
    IndexResult estimate(const PreparedRows& prepared, const IndexStatus& status,
                         const std::set<CubeId>& announced) const;

    IndexOptions options_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace otree
