#pragma once

#include <set>
#include <string>
#include <vector>

#include "otree/index_file.hpp"
#include "otree/index_status.hpp"
#include "otree/types.hpp"
#include "otree/weight.hpp"

namespace otree {

// Inclusive value range on one indexed column
struct ColumnFilter {
    std::string column;
    ColumnValue lower;
    ColumnValue upper;
};

/**
 * Files of one revision a sampled and filtered scan has to read.
 *
 * The sample fraction [lower, upper) becomes the weight range
 * [Weight(lower), Weight(upper)). Cubes are walked from the root; a cube's
 * blocks are read when its space meets the filter box and some of its rows
 * can fall below the upper weight, and the walk only descends below cubes
 * whose threshold is under the upper weight. Replicated blocks are never
 * selected since every original row stays in its own cube.
 */
class FileSelector {
public:
    FileSelector(const IndexStatus& status, const std::vector<IndexFile>& files);

    std::vector<std::string> select(double sample_lower, double sample_upper,
                                    const std::vector<ColumnFilter>& filters = {}) const;

private:
    void visit(const CubeId& cube, Weight lower, Weight upper, const Point& from, const Point& to,
               std::vector<std::string>& out) const;
    // Children of cube on the path to some cube with committed data
    std::set<CubeId> present_children(const CubeId& cube) const;

    const IndexStatus& status_;
    const std::vector<IndexFile>& files_;
};

} // namespace otree
