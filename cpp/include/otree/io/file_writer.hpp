#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "otree/index_file.hpp"
#include "otree/revision.hpp"
#include "otree/types.hpp"

namespace otree {

/**
 * Collaborators of the write path: the columnar file writer and the
 * transactional commit log. The index core only needs these contracts.
 */

struct WriteStats {
    int64_t bytes_written = 0;
    int64_t row_count = 0;
};

class FileWriter {
public:
    virtual ~FileWriter() = default;
    virtual void write_row(const Row& row) = 0;
    virtual WriteStats close() = 0;
};

class FileWriterFactory {
public:
    virtual ~FileWriterFactory() = default;
    virtual std::unique_ptr<FileWriter> open(const std::string& path, const Schema& schema) = 0;
    // Drop a file that was written but never committed
    virtual void remove(const std::string& path) = 0;
};

// Reads back the rows of one block of a committed file
class CubeRowSource {
public:
    virtual ~CubeRowSource() = default;
    virtual std::vector<Row> read_block(const IndexFile& file, size_t block_index) = 0;
};

// Committed state of a table at one version
struct TableSnapshot {
    std::string table_id;
    int64_t version = 0;
    Schema schema;
    std::vector<Revision> revisions;  // ascending ids
    std::vector<IndexFile> files;

    bool empty() const noexcept { return revisions.empty(); }
    const Revision* latest_revision() const noexcept;
    const Revision* revision(RevisionID id) const noexcept;
    std::vector<IndexFile> files_of(RevisionID id) const;
};

enum class CommitStatus {
    Committed,
    Conflict
};

struct CommitRequest {
    std::string table_id;
    int64_t read_version = 0;  // snapshot version the changes were computed on
    Schema schema;
    std::optional<Revision> new_revision;
    std::vector<IndexFile> add;
    std::vector<DeleteFile> remove;
};

class CommitLog {
public:
    virtual ~CommitLog() = default;
    virtual TableSnapshot snapshot(const std::string& table_id) = 0;
    // All or nothing; Conflict when the table moved past read_version
    virtual CommitStatus commit(const CommitRequest& request) = 0;
};

} // namespace otree
