#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>

#include "otree/cube_id.hpp"
#include "otree/revision.hpp"
#include "otree/weight.hpp"

namespace otree {

/**
 * Delta computed by one write or optimize pass.
 *
 * Produced once by the estimator, consumed by the rollup and the write path,
 * then dropped. A commit conflict invalidates the whole object.
 */
struct TableChanges {
    bool is_new_revision = false;
    bool is_optimization = false;
    Revision updated_revision;

    // Threshold of every cube visited by the estimator
    std::map<CubeId, Weight> cube_weights;
    // Rows of this batch kept in each cube
    std::map<CubeId, int64_t> input_block_element_counts;

    // Announced cubes the estimation ran against
    std::set<CubeId> announced_set;
    // Cubes with a threshold below MaxValue that are not announced yet
    std::set<CubeId> cubes_to_announce;
    // Cubes whose rows were copied into their children by this pass
    std::set<CubeId> delta_replicated_set;

    std::optional<Weight> cube_weight(const CubeId& cube) const;

    // Threshold of a cube, Weight::MaxValue when the pass never visited it
    Weight cube_max_weight(const CubeId& cube) const;

    int64_t total_element_count() const noexcept;

    /**
     * Fold the result of an independent shard into this one: counts are
     * summed and each threshold becomes the lower of the two. Both sides
     * must belong to the same revision.
     */
    void merge(const TableChanges& other);
};

} // namespace otree
