#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "otree/column_stats.hpp"
#include "otree/cube_id.hpp"
#include "otree/transform.hpp"
#include "otree/types.hpp"

namespace otree {

using RevisionID = int64_t;

/**
 * One immutable indexing generation of a table.
 *
 * Revision ids grow by one per generation, starting at 1. A new revision is
 * needed when incoming values fall outside the transformations or when the
 * indexed columns change; older revisions stay valid for the files written
 * under them.
 */
struct Revision {
    RevisionID revision_id = 0;
    std::string table_id;
    int64_t timestamp = 0;  // creation, ms since epoch
    int64_t desired_cube_size = 0;
    std::vector<Transformer> column_transformers;
    std::vector<Transformation> transformations;

    /**
     * Build a revision for the first batch of a table or of a new column set.
     * Stats supplied in `initial_stats` widen the observed batch bounds.
     */
    static Revision create(const std::string& table_id, RevisionID revision_id, int64_t desired_cube_size,
                           std::vector<Transformer> transformers, const std::vector<ColumnStats>& batch_stats,
                           const std::vector<ColumnStats>& initial_stats = {});

    uint32_t dimensions() const noexcept { return static_cast<uint32_t>(column_transformers.size()); }
    std::vector<std::string> indexed_columns() const;
    bool matches_columns(const std::vector<std::string>& columns) const;

    // Positions of the indexed columns in a schema, in transformer order
    std::vector<size_t> column_indices(const Schema& schema) const;

    // Normalized coordinates of a row
    Point transform(const Row& row, const std::vector<size_t>& columns) const;

    // Coordinate on `dimension` of a row whose cell `skip` is missing
    static double spread_coordinate(const Row& row, size_t skip, size_t dimension);

    // False when some transformation is superseded by the stats
    bool accepts(const std::vector<ColumnStats>& stats) const;

    // Copy with id + 1 whose transformations cover the stats
    Revision widened(const std::vector<ColumnStats>& stats, int64_t timestamp) const;

    CubeId root() const { return CubeId::root(dimensions()); }
    CubeId create_cube_id(std::span<const uint8_t> bytes) const { return CubeId::from_bytes(dimensions(), bytes); }
    CubeId create_cube_id(std::string_view text) const { return CubeId::from_string(dimensions(), text); }

    bool operator==(const Revision&) const = default;
};

int64_t current_time_millis();

} // namespace otree
