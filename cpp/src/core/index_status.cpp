#include "otree/index_status.hpp"
#include "otree/error.hpp"

#include <algorithm>

namespace otree {

IndexStatus IndexStatus::from_files(const Revision& revision, const std::vector<IndexFile>& files,
                                    std::set<CubeId> announced) {
    IndexStatus status;
    status.revision = revision;
    status.announced_set = std::move(announced);

    for (const IndexFile& file : files) {
        if (file.revision_id != revision.revision_id) continue;

        for (const Block& block : file.blocks) {
            if (block.cube.dimensions() != revision.dimensions()) {
                throw CorruptDataError("Block of file '" + file.path + "' has " +
                                       std::to_string(block.cube.dimensions()) +
                                       " dimensions, revision has " + std::to_string(revision.dimensions()));
            }
            auto [it, inserted] = status.cubes.try_emplace(block.cube);
            CubeStatus& cube = it->second;
            if (inserted) {
                cube.cube = block.cube;
            }
            cube.max_weight = std::min(cube.max_weight, block.max_weight);
            cube.min_weight = std::min(cube.min_weight, block.min_weight);
            if (block.replicated) {
                cube.replicated_element_count += block.element_count;
                if (auto parent = block.cube.parent()) {
                    status.replicated_set.insert(*parent);
                }
            } else {
                cube.element_count += block.element_count;
            }
            if (std::find(cube.files.begin(), cube.files.end(), file.path) == cube.files.end()) {
                cube.files.push_back(file.path);
            }
        }
    }
    return status;
}

const CubeStatus* IndexStatus::find(const CubeId& cube) const {
    auto it = cubes.find(cube);
    return it == cubes.end() ? nullptr : &it->second;
}

Weight IndexStatus::max_weight(const CubeId& cube) const {
    const CubeStatus* s = find(cube);
    return s ? s->max_weight : Weight::MaxValue;
}

int64_t IndexStatus::element_count(const CubeId& cube) const {
    const CubeStatus* s = find(cube);
    return s ? s->element_count : 0;
}

} // namespace otree
