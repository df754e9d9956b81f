#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "otree/cube_id.hpp"
#include "otree/index_file.hpp"
#include "otree/revision.hpp"
#include "otree/weight.hpp"

namespace otree {

// Committed state of one cube
struct CubeStatus {
    CubeId cube;
    Weight max_weight = Weight::MaxValue;
    Weight min_weight = Weight::MaxValue;
    int64_t element_count = 0;             // own rows
    int64_t replicated_element_count = 0;  // rows copied from the parent
    std::vector<std::string> files;
};

/**
 * Per-revision view of a table derived from its committed files. This is
 * the prior cube state indexNext extends.
 */
struct IndexStatus {
    Revision revision;
    std::map<CubeId, CubeStatus> cubes;
    std::set<CubeId> replicated_set;
    std::set<CubeId> announced_set;

    /**
     * Fold the blocks of every file of `revision` into per-cube status.
     * Files of other revisions are ignored. A cube's threshold is the lowest
     * max weight among its blocks, since thresholds only ever decrease.
     */
    static IndexStatus from_files(const Revision& revision, const std::vector<IndexFile>& files,
                                  std::set<CubeId> announced = {});

    static IndexStatus empty(const Revision& revision) {
        IndexStatus status;
        status.revision = revision;
        return status;
    }

    const CubeStatus* find(const CubeId& cube) const;
    Weight max_weight(const CubeId& cube) const;
    int64_t element_count(const CubeId& cube) const;
};

} // namespace otree
