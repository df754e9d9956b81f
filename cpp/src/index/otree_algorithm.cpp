#include "otree/otree_algorithm.hpp"
#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"
#include "otree/row_hash.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace otree {

// Per-row inputs of the estimator, computed once per batch
struct OTreeAlgorithm::PreparedRows {
    const Revision* revision = nullptr;
    std::vector<Point> points;
    std::vector<Weight> weights;
    std::vector<uint64_t> identities;

    size_t size() const noexcept { return weights.size(); }
};

namespace {

// Outcome of ranking one cube group
struct CubeDecision {
    Weight threshold = Weight::MaxValue;
    size_t kept = 0;
    int64_t overflow = 0;
};

Weight weight_below(Weight w) {
    return w.value == Weight::MIN_INT ? Weight::MinValue : Weight(w.value - 1);
}

void check_rows(const RowBatch& batch) {
    for (size_t i = 0; i < batch.rows.size(); ++i) {
        if (batch.rows[i].size() != batch.schema.size()) {
            throw InvalidArgumentError("Row " + std::to_string(i) + " has " +
                                       std::to_string(batch.rows[i].size()) + " values, schema has " +
                                       std::to_string(batch.schema.size()));
        }
    }
}

} // anonymous namespace

IndexOptions IndexOptions::from_config() {
    Config& config = Config::getInstance();
    IndexOptions options;
    options.desired_cube_size = config.get<long long>("index.desired_cube_size", 100000);
    options.max_depth = static_cast<uint32_t>(config.get<int>("index.max_depth", 24));
    options.worker_threads = static_cast<size_t>(std::max(0, config.get<int>("index.worker_threads", 0)));
    return options;
}

OTreeAlgorithm::OTreeAlgorithm(IndexOptions options)
    : options_(std::move(options)) {
    OTREE_CHECK_ARGUMENT(options_.desired_cube_size > 0, "desired cube size must be positive");
    OTREE_CHECK_ARGUMENT(options_.max_depth >= 1 && options_.max_depth <= CubeId::MAX_DEPTH,
                         "max depth must be in [1, " + std::to_string(CubeId::MAX_DEPTH) + "]");
    pool_ = std::make_unique<WorkerPool>(options_.worker_threads);
}

OTreeAlgorithm::~OTreeAlgorithm() = default;

Revision OTreeAlgorithm::bootstrap_revision(const std::string& table_id, RevisionID revision_id,
                                            const RowBatch& batch,
                                            const std::vector<std::string>& columns) const {
    OTREE_CHECK_ARGUMENT(!columns.empty(), "No columns to index");

    std::vector<Transformer> transformers;
    std::vector<size_t> indices;
    transformers.reserve(columns.size());
    for (const std::string& spec : columns) {
        transformers.push_back(Transformer::from_spec(spec, batch.schema));
        indices.push_back(batch.schema.require_index(transformers.back().column()));
    }

    check_rows(batch);
    auto stats = compute_column_stats(batch, indices);
    Revision revision = Revision::create(table_id, revision_id, options_.desired_cube_size,
                                         std::move(transformers), stats, options_.column_stats);
    LOG_INFO("Created revision ", revision.revision_id, " of table '", table_id, "' over ",
             revision.dimensions(), " columns");
    return revision;
}

OTreeAlgorithm::PreparedRows OTreeAlgorithm::prepare(const RowBatch& batch, const Revision& revision) const {
    check_rows(batch);
    const std::vector<size_t> columns = revision.column_indices(batch.schema);

    PreparedRows prepared;
    prepared.revision = &revision;
    prepared.points.resize(batch.rows.size());
    prepared.weights.resize(batch.rows.size());
    prepared.identities.resize(batch.rows.size());

    pool_->parallel_for(0, batch.rows.size(), [&](size_t i) {
        const Row& row = batch.rows[i];
        prepared.points[i] = revision.transform(row, columns);
        prepared.weights[i] = row_weight(row, batch.schema, columns);
        prepared.identities[i] = row_identity(row, batch.schema);
    });
    return prepared;
}

IndexResult OTreeAlgorithm::estimate(const PreparedRows& prepared, const IndexStatus& status,
                                     const std::set<CubeId>& announced) const {
    const Revision& revision = *prepared.revision;
    const int64_t desired = revision.desired_cube_size;
    const uint32_t max_depth = options_.max_depth;

    IndexResult result;
    TableChanges& changes = result.changes;
    changes.updated_revision = revision;
    changes.announced_set = status.announced_set;
    changes.announced_set.insert(announced.begin(), announced.end());
    result.rows.reserve(prepared.size());

    auto rank_less = [&](size_t a, size_t b) {
        return std::tie(prepared.weights[a], prepared.identities[a], a) <
               std::tie(prepared.weights[b], prepared.identities[b], b);
    };

    std::map<CubeId, std::vector<size_t>> level;
    if (prepared.size() > 0) {
        std::vector<size_t> all(prepared.size());
        for (size_t i = 0; i < all.size(); ++i) all[i] = i;
        level.emplace(revision.root(), std::move(all));
    }

    for (uint32_t depth = 0; !level.empty(); ++depth) {
        std::vector<std::pair<CubeId, std::vector<size_t>>> groups(
            std::make_move_iterator(level.begin()), std::make_move_iterator(level.end()));
        level.clear();
        std::vector<CubeDecision> decisions(groups.size());

        pool_->parallel_for(0, groups.size(), [&](size_t g) {
            const CubeId& cube = groups[g].first;
            std::vector<size_t>& rows = groups[g].second;
            std::sort(rows.begin(), rows.end(), rank_less);

            const Weight prior_weight = status.max_weight(cube);
            const int64_t prior_count = status.element_count(cube);
            const size_t eligible = static_cast<size_t>(
                std::partition_point(rows.begin(), rows.end(),
                                     [&](size_t r) { return prepared.weights[r] <= prior_weight; }) -
                rows.begin());

            CubeDecision& decision = decisions[g];
            decision.threshold = prior_weight;

            if (depth >= max_depth) {
                decision.kept = rows.size();
                const int64_t total = prior_count + static_cast<int64_t>(rows.size());
                decision.overflow = std::clamp<int64_t>(total - desired, 0, static_cast<int64_t>(rows.size()));
            } else if (changes.announced_set.contains(cube) && prior_weight < Weight::MaxValue) {
                decision.kept = eligible;
            } else {
                const int64_t capacity = std::max<int64_t>(0, desired - prior_count);
                if (static_cast<int64_t>(eligible) <= capacity) {
                    decision.kept = eligible;
                } else if (capacity == 0) {
                    decision.threshold = std::min(prior_weight, weight_below(prepared.weights[rows.front()]));
                } else {
                    decision.kept = static_cast<size_t>(capacity);
                    decision.threshold = prepared.weights[rows[decision.kept - 1]];
                }
            }
        });

        for (size_t g = 0; g < groups.size(); ++g) {
            const CubeId& cube = groups[g].first;
            const std::vector<size_t>& rows = groups[g].second;
            const CubeDecision& decision = decisions[g];

            changes.cube_weights[cube] = decision.threshold;
            if (decision.threshold < Weight::MaxValue && !changes.announced_set.contains(cube)) {
                changes.cubes_to_announce.insert(cube);
            }
            if (decision.kept > 0) {
                changes.input_block_element_counts[cube] += static_cast<int64_t>(decision.kept);
            }
            if (decision.overflow > 0) {
                result.overflowed_rows += decision.overflow;
                LOG_WARN("Cube '", cube.to_string(), "' at max depth ", depth, " exceeds desired size ",
                         desired, " by ", decision.overflow, " rows");
            }

            for (size_t k = 0; k < rows.size(); ++k) {
                const size_t r = rows[k];
                if (k < decision.kept) {
                    result.rows.push_back(IndexedRow{r, cube, prepared.weights[r], false});
                } else {
                    level[cube.child_containing(prepared.points[r])].push_back(r);
                }
            }
        }

        if (Logger::getInstance().enabled(LogLevel::DEBUG)) {
            size_t pushed = 0;
            for (const auto& [child, rows] : level) pushed += rows.size();
            LOG_DEBUG("Depth ", depth, ": ", groups.size(), " cubes, ", pushed, " rows pushed down");
        }
    }

    std::sort(result.rows.begin(), result.rows.end(),
              [](const IndexedRow& a, const IndexedRow& b) { return a.row < b.row; });

    LOG_DEBUG("Indexed ", prepared.size(), " rows into ", changes.input_block_element_counts.size(),
              " cubes of revision ", revision.revision_id);
    return result;
}

IndexResult OTreeAlgorithm::index_first(const RowBatch& batch, const Revision& revision) const {
    check_rows(batch);
    const auto stats = compute_column_stats(batch, revision.column_indices(batch.schema));

    Revision effective = revision;
    if (!revision.accepts(stats)) {
        // Nothing was committed under this revision yet: widen in place
        effective = revision.widened(stats, revision.timestamp);
        effective.revision_id = revision.revision_id;
    }

    IndexResult result = estimate(prepare(batch, effective), IndexStatus::empty(effective), {});
    result.changes.is_new_revision = true;
    return result;
}

IndexResult OTreeAlgorithm::index_next(const RowBatch& batch, const IndexStatus& status,
                                       const std::set<CubeId>& announced) const {
    check_rows(batch);
    const auto stats = compute_column_stats(batch, status.revision.column_indices(batch.schema));

    if (!status.revision.accepts(stats)) {
        const Revision next = status.revision.widened(stats, current_time_millis());
        LOG_INFO("Batch exceeds bounds of revision ", status.revision.revision_id, " of table '",
                 status.revision.table_id, "', creating revision ", next.revision_id);
        IndexResult result = estimate(prepare(batch, next), IndexStatus::empty(next), {});
        result.changes.is_new_revision = true;
        return result;
    }

    IndexResult result = estimate(prepare(batch, status.revision), status, announced);
    result.changes.is_new_revision = false;
    return result;
}

IndexResult OTreeAlgorithm::replicate(const RowBatch& batch, const std::vector<CubeId>& origins,
                                      const IndexStatus& status) const {
    OTREE_CHECK_ARGUMENT(origins.size() == batch.rows.size(),
                         "Expected one origin cube per row, got " + std::to_string(origins.size()) +
                         " for " + std::to_string(batch.rows.size()) + " rows");

    const Revision& revision = status.revision;
    const PreparedRows prepared = prepare(batch, revision);

    IndexResult result;
    TableChanges& changes = result.changes;
    changes.is_optimization = true;
    changes.updated_revision = revision;
    changes.announced_set = status.announced_set;
    result.rows.reserve(batch.rows.size());

    std::set<CubeId> skipped;
    for (size_t i = 0; i < origins.size(); ++i) {
        const CubeId& origin = origins[i];
        if (origin.dimensions() != revision.dimensions()) {
            throw InvalidArgumentError("Origin cube '" + origin.to_string() + "' does not belong to revision " +
                                       std::to_string(revision.revision_id));
        }
        if (origin.depth() >= options_.max_depth) {
            skipped.insert(origin);
            continue;
        }
        CubeId target = origin.child_containing(prepared.points[i]);
        changes.cube_weights.emplace(target, status.max_weight(target));
        changes.input_block_element_counts[target] += 1;
        changes.delta_replicated_set.insert(origin);
        result.rows.push_back(IndexedRow{i, std::move(target), prepared.weights[i], true});
    }

    for (const CubeId& cube : skipped) {
        LOG_WARN("Cube '", cube.to_string(), "' is at max depth and cannot be replicated");
    }
    LOG_DEBUG("Replicated ", result.rows.size(), " rows of ", changes.delta_replicated_set.size(), " cubes");
    return result;
}

} // namespace otree
