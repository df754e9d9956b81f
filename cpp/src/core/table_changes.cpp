#include "otree/table_changes.hpp"
#include "otree/error.hpp"

#include <algorithm>

namespace otree {

std::optional<Weight> TableChanges::cube_weight(const CubeId& cube) const {
    auto it = cube_weights.find(cube);
    if (it == cube_weights.end()) {
        return std::nullopt;
    }
    return it->second;
}

Weight TableChanges::cube_max_weight(const CubeId& cube) const {
    return cube_weight(cube).value_or(Weight::MaxValue);
}

int64_t TableChanges::total_element_count() const noexcept {
    int64_t total = 0;
    for (const auto& [cube, count] : input_block_element_counts) {
        total += count;
    }
    return total;
}

void TableChanges::merge(const TableChanges& other) {
    if (other.updated_revision.revision_id != updated_revision.revision_id ||
        other.updated_revision.table_id != updated_revision.table_id) {
        throw InvalidArgumentError("Cannot merge table changes of different revisions",
                                   updated_revision.table_id + "@" +
                                   std::to_string(updated_revision.revision_id) + " vs " +
                                   other.updated_revision.table_id + "@" +
                                   std::to_string(other.updated_revision.revision_id));
    }

    is_new_revision = is_new_revision || other.is_new_revision;
    is_optimization = is_optimization && other.is_optimization;

    for (const auto& [cube, weight] : other.cube_weights) {
        auto [it, inserted] = cube_weights.emplace(cube, weight);
        if (!inserted) {
            it->second = std::min(it->second, weight);
        }
    }
    for (const auto& [cube, count] : other.input_block_element_counts) {
        input_block_element_counts[cube] += count;
    }

    announced_set.insert(other.announced_set.begin(), other.announced_set.end());
    delta_replicated_set.insert(other.delta_replicated_set.begin(), other.delta_replicated_set.end());

    cubes_to_announce.clear();
    for (const auto& [cube, weight] : cube_weights) {
        if (weight < Weight::MaxValue && !announced_set.contains(cube)) {
            cubes_to_announce.insert(cube);
        }
    }
}

} // namespace otree
