#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "otree/io/file_writer.hpp"
#include "otree/keeper/keeper.hpp"
#include "otree/otree_algorithm.hpp"

namespace otree {

struct OptimizeResult {
    std::vector<std::string> replicated;  // cubes reported to the keeper
    std::vector<IndexFile> files;
    int64_t replicated_rows = 0;
};

/**
 * Background optimization of one table: replicates announced cubes into
 * their children. Original rows never move; the copies land in new files
 * written with data_change = false.
 */
class TableOptimizer {
public:
    TableOptimizer(std::string table_id, CommitLog& log, Keeper& keeper, FileWriterFactory& files,
                   CubeRowSource& source, IndexOptions options = IndexOptions::from_config(),
                   int commit_retries = -1);

    OptimizeResult optimize(RevisionID revision_id, size_t cube_limit);

private:
    std::string table_id_;
    CommitLog& log_;
    Keeper& keeper_;
    FileWriterFactory& files_;
    CubeRowSource& source_;
    OTreeAlgorithm algorithm_;
    int commit_retries_;
};

} // namespace otree
