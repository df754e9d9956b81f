#include "otree/index_file.hpp"

#include <algorithm>

namespace otree {

int64_t IndexFile::element_count() const noexcept {
    int64_t total = 0;
    for (const Block& block : blocks) {
        total += block.element_count;
    }
    return total;
}

bool IndexFile::has_cube_data(const CubeId& cube) const noexcept {
    return std::any_of(blocks.begin(), blocks.end(),
                       [&](const Block& block) { return block.cube == cube; });
}

DeleteFile tombstone(const IndexFile& file, int64_t timestamp, bool data_change) {
    DeleteFile out;
    out.path = file.path;
    out.size = file.size;
    out.data_change = data_change;
    out.deletion_timestamp = timestamp;
    return out;
}

} // namespace otree
