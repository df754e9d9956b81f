#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "otree/cube_id.hpp"
#include "otree/otree_algorithm.hpp"
#include "otree/table_changes.hpp"
#include "otree/types.hpp"

namespace otree {

/**
 * Groups cubes into output files of roughly the desired size.
 *
 * Deepest cubes first, every cube whose accumulated count is still below the
 * limit hands itself and whatever it collected to its parent. A cube that
 * reaches the limit keeps its group; the root keeps whatever is left. A group
 * is named after its head cube, which is an ancestor of (or equal to) every
 * member, so the grouping is a pure function of the counts. Cubes with no
 * rows are skipped.
 */
class Rollup {
public:
    explicit Rollup(int64_t limit);

    Rollup& populate(const CubeId& cube, int64_t count);

    // Cube -> head cube of its group, for every cube with rows
    std::map<CubeId, CubeId> compute() const;

private:
    int64_t limit_;
    std::map<CubeId, int64_t> counts_;
};

// Rollup of the batch counts of a pass, limited by the revision's desired size
std::map<CubeId, CubeId> compute_rollup(const TableChanges& changes);

// Output file name (a random UUID) of every rollup group
class RollupPlan {
public:
    static RollupPlan create(const std::map<CubeId, CubeId>& groups);

    // Throws for cubes the rollup never saw
    const std::string& file_for(const CubeId& cube) const;

    const std::map<CubeId, std::string>& group_files() const noexcept { return group_files_; }
    size_t group_count() const noexcept { return group_files_.size(); }

private:
    std::map<CubeId, std::string> cube_files_;
    std::map<CubeId, std::string> group_files_;
};

// Column names appended by extended_batch
inline constexpr const char* CUBE_COLUMN = "_cubeId";
inline constexpr const char* WEIGHT_COLUMN = "_weight";
inline constexpr const char* FILE_COLUMN = "_fileUUID";

/**
 * Input rows with their placement appended: cube (CubeId::bytes form, read
 * back with Revision::create_cube_id), weight and output file. Replicated
 * rows appear once per placement.
 */
RowBatch extended_batch(const RowBatch& batch, const IndexResult& result, const RollupPlan& plan);

} // namespace otree
