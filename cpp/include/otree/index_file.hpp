#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "otree/cube_id.hpp"
#include "otree/revision.hpp"
#include "otree/weight.hpp"

namespace otree {

/**
 * Run of rows of one (revision, cube) inside a physical file.
 *
 * min_weight is the lowest weight observed in the run. max_weight is the
 * cube's threshold when the file was written (Weight::MaxValue while the
 * cube still accepts rows). Replicated blocks hold copies of an ancestor's
 * rows and are written by the optimizer.
 */
struct Block {
    CubeId cube;
    Weight min_weight = Weight::MaxValue;
    Weight max_weight = Weight::MaxValue;
    int64_t element_count = 0;
    bool replicated = false;

    bool operator==(const Block&) const = default;
};

// One committed physical file. Immutable once committed.
struct IndexFile {
    std::string path;
    int64_t size = 0;
    bool data_change = true;
    int64_t modification_time = 0;
    RevisionID revision_id = 0;
    std::vector<Block> blocks;
    std::optional<std::string> stats;

    int64_t element_count() const noexcept;
    bool has_cube_data(const CubeId& cube) const noexcept;

    bool operator==(const IndexFile&) const = default;
};

// Tombstone of a removed file
struct DeleteFile {
    std::string path;
    int64_t size = 0;
    bool data_change = true;
    int64_t deletion_timestamp = 0;

    bool operator==(const DeleteFile&) const = default;
};

DeleteFile tombstone(const IndexFile& file, int64_t timestamp, bool data_change = true);

} // namespace otree
