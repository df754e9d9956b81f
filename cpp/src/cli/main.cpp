// =============================================================================
// otree CLI
// =============================================================================
//
// Usage:
//   otree <command> [options]
//
// Commands:
//   index       Index a CSV file into an in-memory table and show the tree
//   config      Show the effective configuration
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   otree index data.csv --columns x,y --cube-size 1000
//   otree index data.csv --columns x,city:hashing --sample 0 0.1
//   OTREE_KEEPER=postgres otree index data.csv --columns x,y
//
// =============================================================================

#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/index_status.hpp"
#include "otree/io/csv.hpp"
#include "otree/io/memory_store.hpp"
#include "otree/io/metadata.hpp"
#include "otree/keeper/keeper.hpp"
#include "otree/logging.hpp"
#include "otree/query/file_selector.hpp"
#include "otree/writer/table_writer.hpp"

namespace otree::cli {
    int cmd_index(int argc, char* argv[]);
    int cmd_config(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define OTREE_VERSION_STRING "0.3.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"index",   "Index a CSV file and print cubes, thresholds and files", otree::cli::cmd_index},
    {"config",  "Show the effective configuration", otree::cli::cmd_config},
    {"version", "Show version information", otree::cli::cmd_version},
    {"help",    "Show this help message", otree::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "otree.env";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace otree::cli {

namespace {

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "otree - multi-dimensional index maintenance\n";
    std::cout << "Version " << OTREE_VERSION_STRING << "\n\n";
    std::cout << "Usage: otree [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: otree.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "\nIndex Options:\n";
    std::cout << "  --columns <a,b:hashing> Columns to index (required)\n";
    std::cout << "  --table <name>          Table id (default: file name)\n";
    std::cout << "  --cube-size <n>         Desired cube size (default: index.desired_cube_size)\n";
    std::cout << "  --max-depth <n>         Maximum tree depth (default: index.max_depth)\n";
    std::cout << "  --sample <lo> <hi>      Also list the files a sample of [lo, hi) reads\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  OTREE_DESIRED_CUBE_SIZE, OTREE_MAX_DEPTH, OTREE_WORKER_THREADS,\n";
    std::cout << "  OTREE_KEEPER (local|postgres), OTREE_DB_HOST/PORT/USER/PASS/NAME,\n";
    std::cout << "  OTREE_LOG_LEVEL, OTREE_LOG_FILE\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "otree " << OTREE_VERSION_STRING << "\n";
    std::cout << "Cube dimensions: up to " << CubeId::MAX_DIMENSIONS
              << ", depth up to " << CubeId::MAX_DEPTH << "\n";
    return 0;
}

// =============================================================================
// Config Command
// =============================================================================

int cmd_config([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    for (const auto& [key, value] : Config::getInstance().entries()) {
        std::cout << std::left << std::setw(26) << key
                  << (key == "db.password" && !value.empty() ? "****" : value) << "\n";
    }
    return 0;
}

// =============================================================================
// Index Command
// =============================================================================

int cmd_index(int argc, char* argv[]) {
    std::string path;
    std::string table;
    std::vector<std::string> columns;
    IndexOptions options = IndexOptions::from_config();
    bool sample = false;
    double sample_lower = 0.0;
    double sample_upper = 1.0;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--columns" && i + 1 < argc) {
            columns = split_list(argv[++i]);
        } else if (arg == "--table" && i + 1 < argc) {
            table = argv[++i];
        } else if (arg == "--cube-size" && i + 1 < argc) {
            options.desired_cube_size = std::stoll(argv[++i]);
        } else if (arg == "--max-depth" && i + 1 < argc) {
            options.max_depth = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--sample" && i + 2 < argc) {
            sample = true;
            sample_lower = std::stod(argv[++i]);
            sample_upper = std::stod(argv[++i]);
        } else if (arg[0] != '-' && path.empty()) {
            path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (path.empty() || columns.empty()) {
        std::cerr << "Usage: otree index <file.csv> --columns <a,b,...> [options]\n";
        return 1;
    }
    if (table.empty()) {
        table = path;
    }

    RowBatch batch = read_csv_file(path);
    LOG_INFO("Read ", batch.size(), " rows from ", path);

    InMemoryCommitLog log;
    MemoryFileStore files;
    auto keeper = make_keeper();
    TableWriter writer(table, log, *keeper, files, options);
    const WriteResult result = writer.write(batch, columns);

    const TableSnapshot snapshot = log.snapshot(table);
    const Revision& revision = *snapshot.revision(result.revision_id);
    const IndexStatus status = IndexStatus::from_files(revision, snapshot.files_of(revision.revision_id));

    std::cout << "Revision:\n  " << metadata::serialize_revision(revision) << "\n\n";

    std::cout << "Cubes (" << status.cubes.size() << "):\n";
    std::cout << "  " << std::left << std::setw(20) << "cube" << std::setw(8) << "depth"
              << std::setw(12) << "elements" << "max weight\n";
    for (const auto& [cube, cube_status] : status.cubes) {
        std::cout << "  " << std::left << std::setw(20) << (cube.is_root() ? "<root>" : cube.to_string())
                  << std::setw(8) << cube.depth() << std::setw(12) << cube_status.element_count;
        if (cube_status.max_weight == Weight::MaxValue) {
            std::cout << "open\n";
        } else {
            std::cout << cube_status.max_weight.value << " (" << std::fixed << std::setprecision(4)
                      << cube_status.max_weight.fraction() << ")\n";
        }
    }

    std::cout << "\nFiles (" << result.files.size() << "):\n";
    for (const IndexFile& file : result.files) {
        std::cout << "  " << file.path << "  " << file.element_count() << " rows in "
                  << file.blocks.size() << " blocks\n";
    }

    if (!result.announced.empty()) {
        std::cout << "\nAnnounced " << result.announced.size() << " cubes\n";
    }
    if (result.overflowed_rows > 0) {
        std::cout << "\n" << result.overflowed_rows << " rows overflowed at max depth\n";
    }

    if (sample) {
        FileSelector selector(status, snapshot.files);
        const auto selected = selector.select(sample_lower, sample_upper);
        std::cout << "\nSample [" << sample_lower << ", " << sample_upper << ") reads "
                  << selected.size() << " of " << result.files.size() << " files\n";
        for (const std::string& file : selected) {
            std::cout << "  " << file << "\n";
        }
    }

    keeper->stop();
    return 0;
}

} // namespace otree::cli

// =============================================================================
// Main Entry Point
// =============================================================================

// Consumes global options; returns the index of the command name
static int parse_global_options(int argc, char* argv[]) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            break;
        }
        ++i;
    }
    return i;
}

int main(int argc, char* argv[]) {
    const int first = parse_global_options(argc, argv);

    if (!otree::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        otree::set_log_level(otree::LogLevel::DEBUG);
        otree::Config::getInstance().print();
    } else if (g_options.quiet) {
        otree::set_log_level(otree::LogLevel::ERROR);
    }

    if (first >= argc) {
        otree::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[first];
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc - first - 1, argv + first + 1);
            } catch (const otree::OTreeException& e) {
                LOG_ERROR(e.what());
                return 2;
            } catch (const std::exception& e) {
                LOG_ERROR("Unexpected error: ", e.what());
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'otree help' for usage.\n";
    return 1;
}
