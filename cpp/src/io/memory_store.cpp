#include "otree/io/memory_store.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace otree {

namespace {

int64_t value_size(const ColumnValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return static_cast<int64_t>(s->size());
    }
    if (const auto* b = std::get_if<Bytes>(&value)) {
        return static_cast<int64_t>(b->size());
    }
    return is_null(value) ? 1 : 8;
}

} // anonymous namespace

class MemoryFileWriter : public FileWriter {
public:
    MemoryFileWriter(MemoryFileStore& store, std::string path, size_t columns)
        : store_(store), path_(std::move(path)), columns_(columns) {}

    void write_row(const Row& row) override {
        if (closed_) {
            throw OTreeException(ErrorCode::WRITE_FAILED, "Write to closed file '" + path_ + "'");
        }
        if (row.size() != columns_) {
            throw InvalidArgumentError("Row has " + std::to_string(row.size()) + " values, file '" + path_ +
                                       "' has " + std::to_string(columns_) + " columns");
        }
        for (const ColumnValue& value : row) {
            bytes_ += value_size(value);
        }
        rows_.push_back(row);
    }

    WriteStats close() override {
        if (closed_) {
            throw OTreeException(ErrorCode::WRITE_FAILED, "File '" + path_ + "' closed twice");
        }
        closed_ = true;
        WriteStats stats{bytes_, static_cast<int64_t>(rows_.size())};
        store_.store(path_, std::move(rows_));
        return stats;
    }

private:
    MemoryFileStore& store_;
    std::string path_;
    size_t columns_;
    std::vector<Row> rows_;
    int64_t bytes_ = 0;
    bool closed_ = false;
};

std::unique_ptr<FileWriter> MemoryFileStore::open(const std::string& path, const Schema& schema) {
    return std::make_unique<MemoryFileWriter>(*this, path, schema.size());
}

void MemoryFileStore::store(const std::string& path, std::vector<Row> rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = std::move(rows);
}

void MemoryFileStore::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.erase(path);
}

std::vector<Row> MemoryFileStore::read_block(const IndexFile& file, size_t block_index) {
    if (block_index >= file.blocks.size()) {
        throw InvalidArgumentError("File '" + file.path + "' has no block " + std::to_string(block_index));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file.path);
    if (it == files_.end()) {
        throw OTreeException(ErrorCode::CORRUPT_DATA, "Missing file '" + file.path + "'");
    }

    int64_t offset = 0;
    for (size_t i = 0; i < block_index; ++i) {
        offset += file.blocks[i].element_count;
    }
    const int64_t end = offset + file.blocks[block_index].element_count;
    if (end > static_cast<int64_t>(it->second.size())) {
        OTREE_THROW_CORRUPT("Blocks of '" + file.path + "' describe more rows than the file holds");
    }
    return std::vector<Row>(it->second.begin() + offset, it->second.begin() + end);
}

bool MemoryFileStore::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.contains(path);
}

std::vector<Row> MemoryFileStore::rows(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    return it == files_.end() ? std::vector<Row>{} : it->second;
}

size_t MemoryFileStore::file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

// ============================================================================
// Commit log
// ============================================================================

const Revision* TableSnapshot::latest_revision() const noexcept {
    return revisions.empty() ? nullptr : &revisions.back();
}

const Revision* TableSnapshot::revision(RevisionID id) const noexcept {
    for (const Revision& r : revisions) {
        if (r.revision_id == id) return &r;
    }
    return nullptr;
}

std::vector<IndexFile> TableSnapshot::files_of(RevisionID id) const {
    std::vector<IndexFile> out;
    std::copy_if(files.begin(), files.end(), std::back_inserter(out),
                 [id](const IndexFile& f) { return f.revision_id == id; });
    return out;
}

TableSnapshot InMemoryCommitLog::snapshot(const std::string& table_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        TableSnapshot empty;
        empty.table_id = table_id;
        return empty;
    }
    return it->second.snapshot;
}

CommitStatus InMemoryCommitLog::commit(const CommitRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    TableLog& log = tables_[request.table_id];
    TableSnapshot& current = log.snapshot;
    current.table_id = request.table_id;

    if (request.read_version != current.version) {
        LOG_DEBUG("Commit on '", request.table_id, "' read version ", request.read_version,
                  " but table is at ", current.version);
        return CommitStatus::Conflict;
    }

    if (request.new_revision) {
        const Revision* latest = current.latest_revision();
        const RevisionID expected = latest ? latest->revision_id + 1 : 1;
        if (request.new_revision->revision_id != expected) {
            throw InvalidArgumentError("Revision " + std::to_string(request.new_revision->revision_id) +
                                       " does not follow " + std::to_string(expected - 1),
                                       request.table_id);
        }
    }
    for (const IndexFile& file : request.add) {
        const bool known = current.revision(file.revision_id) ||
                           (request.new_revision && request.new_revision->revision_id == file.revision_id);
        if (!known) {
            throw OTreeException(ErrorCode::UNKNOWN_REVISION,
                                 "File '" + file.path + "' references unknown revision " +
                                 std::to_string(file.revision_id), request.table_id);
        }
    }

    if (request.new_revision) {
        current.revisions.push_back(*request.new_revision);
    }
    if (!request.schema.fields().empty()) {
        current.schema = request.schema;
    }

    std::set<std::string> removed;
    for (const DeleteFile& tombstone : request.remove) {
        removed.insert(tombstone.path);
        log.tombstones.push_back(tombstone);
    }
    std::erase_if(current.files, [&](const IndexFile& f) { return removed.contains(f.path); });
    current.files.insert(current.files.end(), request.add.begin(), request.add.end());
    ++current.version;
    return CommitStatus::Committed;
}

std::vector<DeleteFile> InMemoryCommitLog::tombstones(const std::string& table_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    return it == tables_.end() ? std::vector<DeleteFile>{} : it->second.tombstones;
}

} // namespace otree
