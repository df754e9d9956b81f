#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "otree/io/file_writer.hpp"

namespace otree {

/**
 * Files kept in memory as row vectors. Serves as writer factory and as the
 * row source of the optimizer; sizes are estimated from the values.
 */
class MemoryFileStore : public FileWriterFactory, public CubeRowSource {
public:
    std::unique_ptr<FileWriter> open(const std::string& path, const Schema& schema) override;
    void remove(const std::string& path) override;
    std::vector<Row> read_block(const IndexFile& file, size_t block_index) override;

    bool contains(const std::string& path) const;
    std::vector<Row> rows(const std::string& path) const;
    size_t file_count() const;

private:
    friend class MemoryFileWriter;

    void store(const std::string& path, std::vector<Row> rows);

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Row>> files_;
};

/**
 * Single-process commit log with optimistic version checks. Keeps the
 * tombstones of removed files.
 */
class InMemoryCommitLog : public CommitLog {
public:
    TableSnapshot snapshot(const std::string& table_id) override;
    CommitStatus commit(const CommitRequest& request) override;

    std::vector<DeleteFile> tombstones(const std::string& table_id) const;

private:
    struct TableLog {
        TableSnapshot snapshot;
        std::vector<DeleteFile> tombstones;
    };

    mutable std::mutex mutex_;
    std::map<std::string, TableLog> tables_;
};

} // namespace otree
