#include "otree/writer/table_optimizer.hpp"
#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"
#include "otree/rollup.hpp"
#include "otree/writer/table_writer.hpp"

namespace otree {

TableOptimizer::TableOptimizer(std::string table_id, CommitLog& log, Keeper& keeper, FileWriterFactory& files,
                               CubeRowSource& source, IndexOptions options, int commit_retries)
    : table_id_(std::move(table_id)), log_(log), keeper_(keeper), files_(files), source_(source),
      algorithm_(std::move(options)),
      commit_retries_(commit_retries >= 0 ? commit_retries
                                          : Config::getInstance().get<int>("writer.commit_retries", 3)) {}

OptimizeResult TableOptimizer::optimize(RevisionID revision_id, size_t cube_limit) {
    LogScope scope(table_id_, revision_id);
    auto session = keeper_.begin_optimization(table_id_, revision_id, cube_limit);
    if (session->cubes_to_optimize().empty()) {
        session->end({});
        return {};
    }

    for (int attempt = 1; attempt <= commit_retries_ + 1; ++attempt) {
        const TableSnapshot snapshot = log_.snapshot(table_id_);
        const Revision* revision = snapshot.revision(revision_id);
        if (!revision) {
            throw OTreeException(ErrorCode::UNKNOWN_REVISION,
                                 "Table '" + table_id_ + "' has no revision " + std::to_string(revision_id));
        }

        const std::set<std::string> reserved(session->cubes_to_optimize().begin(),
                                             session->cubes_to_optimize().end());
        const std::set<CubeId> targets = parse_cubes(*revision, reserved);
        const std::vector<IndexFile> files = snapshot.files_of(revision_id);

        RowBatch batch;
        batch.schema = snapshot.schema;
        std::vector<CubeId> origins;
        for (const IndexFile& file : files) {
            for (size_t b = 0; b < file.blocks.size(); ++b) {
                const CubeId& cube = file.blocks[b].cube;
                if (!targets.contains(cube)) continue;
                for (Row& row : source_.read_block(file, b)) {
                    batch.rows.push_back(std::move(row));
                    origins.push_back(cube);
                }
            }
        }

        const IndexStatus status = IndexStatus::from_files(*revision, files);
        const IndexResult result = algorithm_.replicate(batch, origins, status);
        const RollupPlan plan = RollupPlan::create(compute_rollup(result.changes));
        std::vector<IndexFile> written = write_index_files(batch, result, plan, files_, false);

        CommitRequest request;
        request.table_id = table_id_;
        request.read_version = snapshot.version;
        request.add = written;
        if (log_.commit(request) == CommitStatus::Conflict) {
            LOG_WARN("Optimization commit on '", table_id_, "' conflicted (attempt ", attempt, ")");
            discard_files(files_, written);
            continue;
        }

        // Cubes without rows in this revision count as replicated as well
        OptimizeResult out;
        for (const CubeId& cube : targets) {
            if (cube.depth() < algorithm_.options().max_depth) {
                out.replicated.push_back(cube.to_string());
            }
        }
        out.files = std::move(written);
        out.replicated_rows = static_cast<int64_t>(result.rows.size());
        session->end(std::set<std::string>(out.replicated.begin(), out.replicated.end()));

        LOG_INFO("Replicated ", out.replicated.size(), " cubes (", out.replicated_rows, " rows) of '",
                 table_id_, "' revision ", revision_id);
        return out;
    }

    throw CommitConflictError("Gave up optimizing '" + table_id_ + "' after " +
                              std::to_string(commit_retries_ + 1) + " attempts");
}

} // namespace otree
