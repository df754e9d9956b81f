#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "otree/index_file.hpp"
#include "otree/io/file_writer.hpp"
#include "otree/keeper/keeper.hpp"
#include "otree/otree_algorithm.hpp"
#include "otree/rollup.hpp"

namespace otree {

enum class WriteMode {
    Append,
    Overwrite  // tombstones every committed file of the table
};

struct WriteResult {
    RevisionID revision_id = 0;
    bool new_revision = false;
    std::vector<IndexFile> files;
    std::vector<std::string> announced;
    int attempts = 0;
    int64_t overflowed_rows = 0;
};

/**
 * Write the placed rows of a pass, one file per rollup group. Inside a file
 * rows are laid out cube by cube in CubeId order, one block per cube.
 * Files already written are removed again when a later one fails.
 */
std::vector<IndexFile> write_index_files(const RowBatch& batch, const IndexResult& result,
                                         const RollupPlan& plan, FileWriterFactory& factory,
                                         bool data_change);

/**
 * One table's write path: keeper session, estimation, rollup, files and an
 * optimistic commit. A conflicting commit throws the whole pass away and
 * starts over from a fresh snapshot.
 */
class TableWriter {
public:
    TableWriter(std::string table_id, CommitLog& log, Keeper& keeper, FileWriterFactory& files,
                IndexOptions options = IndexOptions::from_config(), int commit_retries = -1);

    // columns are "name" or "name:kind" specs
    WriteResult write(const RowBatch& batch, const std::vector<std::string>& columns,
                      WriteMode mode = WriteMode::Append);

    const std::string& table_id() const noexcept { return table_id_; }

private:
    std::string table_id_;
    CommitLog& log_;
    Keeper& keeper_;
    FileWriterFactory& files_;
    OTreeAlgorithm algorithm_;
    int commit_retries_;
};

void discard_files(FileWriterFactory& factory, const std::vector<IndexFile>& files);

} // namespace otree
