#include "otree/writer/table_writer.hpp"
#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"

#include <algorithm>
#include <map>

namespace otree {

namespace {

std::vector<std::string> column_names(const std::vector<std::string>& specs) {
    std::vector<std::string> names;
    names.reserve(specs.size());
    for (const std::string& spec : specs) {
        names.push_back(spec.substr(0, spec.find(':')));
    }
    return names;
}

} // anonymous namespace

void discard_files(FileWriterFactory& factory, const std::vector<IndexFile>& files) {
    for (const IndexFile& file : files) {
        factory.remove(file.path);
    }
}

std::vector<IndexFile> write_index_files(const RowBatch& batch, const IndexResult& result,
                                         const RollupPlan& plan, FileWriterFactory& factory,
                                         bool data_change) {
    // file -> cube -> placed rows
    std::map<std::string, std::map<CubeId, std::vector<const IndexedRow*>>> layout;
    for (const IndexedRow& placed : result.rows) {
        layout[plan.file_for(placed.cube)][placed.cube].push_back(&placed);
    }

    const TableChanges& changes = result.changes;
    std::vector<IndexFile> written;
    written.reserve(layout.size());
    try {
        for (const auto& [path, cubes] : layout) {
            auto writer = factory.open(path, batch.schema);
            IndexFile file;
            file.path = path;
            file.data_change = data_change;
            file.revision_id = changes.updated_revision.revision_id;

            for (const auto& [cube, rows] : cubes) {
                Block block;
                block.cube = cube;
                block.max_weight = changes.cube_max_weight(cube);
                block.replicated = rows.front()->replicated;
                for (const IndexedRow* placed : rows) {
                    writer->write_row(batch.rows.at(placed->row));
                    block.min_weight = std::min(block.min_weight, placed->weight);
                    ++block.element_count;
                }
                file.blocks.push_back(std::move(block));
            }

            const WriteStats stats = writer->close();
            if (stats.row_count != file.element_count()) {
                throw OTreeException(ErrorCode::WRITE_FAILED,
                                     "File '" + path + "' holds " + std::to_string(stats.row_count) +
                                     " rows, blocks describe " + std::to_string(file.element_count()));
            }
            file.size = stats.bytes_written;
            file.modification_time = current_time_millis();
            written.push_back(std::move(file));
        }
    } catch (const std::exception&) {
        discard_files(factory, written);
        throw;
    }
    return written;
}

TableWriter::TableWriter(std::string table_id, CommitLog& log, Keeper& keeper, FileWriterFactory& files,
                         IndexOptions options, int commit_retries)
    : table_id_(std::move(table_id)), log_(log), keeper_(keeper), files_(files),
      algorithm_(std::move(options)),
      commit_retries_(commit_retries >= 0 ? commit_retries
                                          : Config::getInstance().get<int>("writer.commit_retries", 3)) {
    OTREE_CHECK_ARGUMENT(!table_id_.empty(), "table id must not be empty");
}

WriteResult TableWriter::write(const RowBatch& batch, const std::vector<std::string>& columns,
                               WriteMode mode) {
    OTREE_CHECK_ARGUMENT(!columns.empty(), "No columns to index");
    const std::vector<std::string> names = column_names(columns);

    for (int attempt = 1; attempt <= commit_retries_ + 1; ++attempt) {
        const TableSnapshot snapshot = log_.snapshot(table_id_);
        const Revision* latest = snapshot.latest_revision();

        if (!snapshot.schema.fields().empty() && mode == WriteMode::Append && !(snapshot.schema == batch.schema)) {
            throw InvalidArgumentError("Batch schema does not match table '" + table_id_ + "'");
        }

        const bool first = !latest || mode == WriteMode::Overwrite || !latest->matches_columns(names);
        const RevisionID target = first ? (latest ? latest->revision_id + 1 : 1) : latest->revision_id;
        LogScope scope(table_id_, target);
        std::unique_ptr<WriteSession> session;
        IndexResult result;

        if (first) {
            const Revision revision = algorithm_.bootstrap_revision(table_id_, target, batch, columns);
            session = keeper_.begin_write(table_id_, target);
            result = algorithm_.index_first(batch, revision);
        } else {
            session = keeper_.begin_write(table_id_, target);
            const IndexStatus status = IndexStatus::from_files(*latest, snapshot.files_of(latest->revision_id),
                                                               parse_cubes(*latest, session->announced_cubes()));
            result = algorithm_.index_next(batch, status, status.announced_set);
        }

        const TableChanges& changes = result.changes;
        const RollupPlan plan = RollupPlan::create(compute_rollup(changes));
        std::vector<IndexFile> written = write_index_files(batch, result, plan, files_, true);

        CommitRequest request;
        request.table_id = table_id_;
        request.read_version = snapshot.version;
        request.schema = batch.schema;
        if (changes.is_new_revision) {
            request.new_revision = changes.updated_revision;
        }
        request.add = written;
        if (mode == WriteMode::Overwrite) {
            const int64_t now = current_time_millis();
            for (const IndexFile& file : snapshot.files) {
                request.remove.push_back(tombstone(file, now));
            }
        }

        if (log_.commit(request) == CommitStatus::Conflict) {
            LOG_WARN("Commit of ", written.size(), " files to '", table_id_, "' conflicted (attempt ",
                     attempt, " of ", commit_retries_ + 1, ")");
            discard_files(files_, written);
            session->end();
            continue;
        }

        WriteResult out;
        out.revision_id = changes.updated_revision.revision_id;
        out.new_revision = changes.is_new_revision;
        out.files = std::move(written);
        out.announced = cube_strings(changes.cubes_to_announce);
        out.attempts = attempt;
        out.overflowed_rows = result.overflowed_rows;

        keeper_.announce(table_id_, out.revision_id, out.announced);
        session->end();

        LOG_INFO("Wrote ", batch.size(), " rows to '", table_id_, "' revision ", out.revision_id, " in ",
                 out.files.size(), " files, ", out.announced.size(), " cubes announced");
        return out;
    }

    throw CommitConflictError("Gave up writing to '" + table_id_ + "' after " +
                              std::to_string(commit_retries_ + 1) + " attempts",
                              table_id_, "Increase writer.commit_retries");
}

} // namespace otree
