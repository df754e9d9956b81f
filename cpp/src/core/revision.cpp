#include "otree/revision.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"
#include "otree/murmur3.hpp"
#include "otree/weight.hpp"

#include <algorithm>
#include <chrono>

namespace otree {

namespace {

const ColumnStats* find_stats(const std::vector<ColumnStats>& stats, const std::string& column) {
    for (const auto& s : stats) {
        if (s.column == column) return &s;
    }
    return nullptr;
}

// Union of two stats of the same column
ColumnStats combine(const ColumnStats& a, const ColumnStats* b) {
    if (!b || !b->has_bounds()) return a;
    if (!a.has_bounds()) return *b;
    ColumnStats out = a;
    out.min = std::min(*a.min, *b->min);
    out.max = std::max(*a.max, *b->max);
    return out;
}

} // anonymous namespace

int64_t current_time_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Revision Revision::create(const std::string& table_id, RevisionID revision_id, int64_t desired_cube_size,
                          std::vector<Transformer> transformers, const std::vector<ColumnStats>& batch_stats,
                          const std::vector<ColumnStats>& initial_stats) {
    OTREE_CHECK_ARGUMENT(!transformers.empty(), "A revision needs at least one indexed column");
    OTREE_CHECK_ARGUMENT(transformers.size() <= CubeId::MAX_DIMENSIONS,
                         "Too many indexed columns: " + std::to_string(transformers.size()));
    OTREE_CHECK_ARGUMENT(desired_cube_size > 0, "desired cube size must be positive");
    OTREE_CHECK_ARGUMENT(revision_id > 0, "revision ids start at 1");

    Revision revision;
    revision.revision_id = revision_id;
    revision.table_id = table_id;
    revision.timestamp = current_time_millis();
    revision.desired_cube_size = desired_cube_size;
    revision.transformations.reserve(transformers.size());

    for (const Transformer& transformer : transformers) {
        ColumnStats stats;
        stats.column = transformer.column();
        stats.type = transformer.type();
        if (const ColumnStats* observed = find_stats(batch_stats, transformer.column())) {
            stats = *observed;
        }
        stats = combine(stats, find_stats(initial_stats, transformer.column()));
        revision.transformations.push_back(transformer.make_transformation(stats));
    }
    revision.column_transformers = std::move(transformers);
    return revision;
}

std::vector<std::string> Revision::indexed_columns() const {
    std::vector<std::string> out;
    out.reserve(column_transformers.size());
    for (const auto& t : column_transformers) {
        out.push_back(t.column());
    }
    return out;
}

bool Revision::matches_columns(const std::vector<std::string>& columns) const {
    return indexed_columns() == columns;
}

std::vector<size_t> Revision::column_indices(const Schema& schema) const {
    std::vector<size_t> out;
    out.reserve(column_transformers.size());
    for (const auto& t : column_transformers) {
        size_t idx = schema.require_index(t.column());
        if (schema[idx].type != t.type()) {
            throw InvalidArgumentError("Column '" + t.column() + "' changed type from " +
                                       to_string(t.type()) + " to " + to_string(schema[idx].type));
        }
        out.push_back(idx);
    }
    return out;
}

// A missing value without a configured null value is placed by the hash of
// the rest of the row, seeded per dimension, so such rows spread over the
// dimension instead of piling up at one end of it
double Revision::spread_coordinate(const Row& row, size_t skip, size_t dimension) {
    int32_t h = Murmur3::DEFAULT_SEED + static_cast<int32_t>(dimension) + 1;
    for (size_t k = 0; k < row.size(); ++k) {
        if (k != skip) {
            h = Murmur3::hash_string(value_to_string(row[k]), h);
        }
    }
    return Weight(h).fraction();
}

Point Revision::transform(const Row& row, const std::vector<size_t>& columns) const {
    Point point(transformations.size());
    for (size_t i = 0; i < transformations.size(); ++i) {
        const ColumnValue& value = row[columns[i]];
        if (is_missing(value) && !transformations[i].has_null_value()) {
            point[i] = spread_coordinate(row, columns[i], i);
        } else {
            point[i] = transformations[i].transform(value);
        }
    }
    return point;
}

bool Revision::accepts(const std::vector<ColumnStats>& stats) const {
    for (size_t i = 0; i < column_transformers.size(); ++i) {
        const ColumnStats* s = find_stats(stats, column_transformers[i].column());
        if (s && !transformations[i].accepts(*s)) {
            return false;
        }
    }
    return true;
}

Revision Revision::widened(const std::vector<ColumnStats>& stats, int64_t now) const {
    Revision next = *this;
    next.revision_id = revision_id + 1;
    next.timestamp = now;
    for (size_t i = 0; i < column_transformers.size(); ++i) {
        const ColumnStats* s = find_stats(stats, column_transformers[i].column());
        if (!s) continue;
        if (auto updated = column_transformers[i].maybe_update(transformations[i], *s)) {
            LOG_DEBUG("Column '", column_transformers[i].column(), "' widened for revision ", next.revision_id);
            next.transformations[i] = std::move(*updated);
        }
    }
    return next;
}

} // namespace otree
