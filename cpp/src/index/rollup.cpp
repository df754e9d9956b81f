#include "otree/rollup.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <optional>
#include <vector>

namespace otree {

Rollup::Rollup(int64_t limit) : limit_(limit) {
    OTREE_CHECK_ARGUMENT(limit > 0, "rollup limit must be positive");
}

Rollup& Rollup::populate(const CubeId& cube, int64_t count) {
    OTREE_CHECK_ARGUMENT(count >= 0, "negative element count for cube '" + cube.to_string() + "'");
    counts_[cube] += count;
    return *this;
}

namespace {

struct DeepestFirst {
    bool operator()(const CubeId& a, const CubeId& b) const {
        if (a.depth() != b.depth()) return a.depth() > b.depth();
        return a < b;
    }
};

struct PendingGroup {
    int64_t count = 0;
    std::vector<CubeId> members;
};

} // anonymous namespace

std::map<CubeId, CubeId> Rollup::compute() const {
    std::map<CubeId, PendingGroup, DeepestFirst> pending;
    for (const auto& [cube, count] : counts_) {
        if (count == 0) continue;
        PendingGroup& group = pending[cube];
        group.count += count;
        group.members.push_back(cube);
    }

    // Parents sort after their children, so every cube is settled only once
    // all of its descendants have been folded into it
    std::map<CubeId, CubeId> groups;
    while (!pending.empty()) {
        auto node = pending.extract(pending.begin());
        const CubeId& cube = node.key();
        PendingGroup& group = node.mapped();

        std::optional<CubeId> parent = cube.parent();
        if (!parent || group.count >= limit_) {
            for (const CubeId& member : group.members) {
                groups.emplace(member, cube);
            }
            continue;
        }
        PendingGroup& up = pending[*parent];
        up.count += group.count;
        up.members.insert(up.members.end(), group.members.begin(), group.members.end());
    }
    return groups;
}

std::map<CubeId, CubeId> compute_rollup(const TableChanges& changes) {
    Rollup rollup(changes.updated_revision.desired_cube_size);
    for (const auto& [cube, count] : changes.input_block_element_counts) {
        rollup.populate(cube, count);
    }
    return rollup.compute();
}

RollupPlan RollupPlan::create(const std::map<CubeId, CubeId>& groups) {
    boost::uuids::random_generator generator;
    RollupPlan plan;
    for (const auto& [cube, group] : groups) {
        auto it = plan.group_files_.find(group);
        if (it == plan.group_files_.end()) {
            it = plan.group_files_.emplace(group, boost::uuids::to_string(generator())).first;
        }
        plan.cube_files_.emplace(cube, it->second);
    }
    LOG_DEBUG("Rollup of ", groups.size(), " cubes into ", plan.group_files_.size(), " files");
    return plan;
}

const std::string& RollupPlan::file_for(const CubeId& cube) const {
    auto it = cube_files_.find(cube);
    if (it == cube_files_.end()) {
        throw InvalidArgumentError("Cube '" + cube.to_string() + "' has no rollup group");
    }
    return it->second;
}

RowBatch extended_batch(const RowBatch& batch, const IndexResult& result, const RollupPlan& plan) {
    std::vector<Field> fields = batch.schema.fields();
    fields.push_back(Field{CUBE_COLUMN, QDataType::Binary});
    fields.push_back(Field{WEIGHT_COLUMN, QDataType::Int});
    fields.push_back(Field{FILE_COLUMN, QDataType::String});

    RowBatch out;
    out.schema = Schema(std::move(fields));
    out.rows.reserve(result.rows.size());
    for (const IndexedRow& placed : result.rows) {
        Row row = batch.rows.at(placed.row);
        row.emplace_back(placed.cube.bytes());
        row.emplace_back(static_cast<int64_t>(placed.weight.value));
        row.emplace_back(plan.file_for(placed.cube));
        out.rows.push_back(std::move(row));
    }
    return out;
}

} // namespace otree
