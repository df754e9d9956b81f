#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "otree/cube_id.hpp"
#include "otree/revision.hpp"

namespace otree {

/**
 * Cluster-wide coordination of announced and optimized cubes.
 *
 * Cubes travel in their string form. Announcement is monotonic within a
 * (table, revision): nothing ever removes an announced cube. Optimization
 * sessions reserve cubes so concurrent optimizers get disjoint sets.
 *
 * Sessions must not outlive the keeper that created them.
 */

class WriteSession {
public:
    WriteSession(std::string id, std::set<std::string> announced_cubes)
        : id_(std::move(id)), announced_cubes_(std::move(announced_cubes)) {}
    virtual ~WriteSession() = default;

    WriteSession(const WriteSession&) = delete;
    WriteSession& operator=(const WriteSession&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::set<std::string>& announced_cubes() const noexcept { return announced_cubes_; }

    // Call after the write was committed, or when it was abandoned
    virtual void end() = 0;

private:
    std::string id_;
    std::set<std::string> announced_cubes_;
};

class OptimizationSession {
public:
    OptimizationSession(std::string id, std::vector<std::string> cubes_to_optimize)
        : id_(std::move(id)), cubes_to_optimize_(std::move(cubes_to_optimize)) {}
    virtual ~OptimizationSession() = default;

    OptimizationSession(const OptimizationSession&) = delete;
    OptimizationSession& operator=(const OptimizationSession&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::vector<std::string>& cubes_to_optimize() const noexcept { return cubes_to_optimize_; }

    // Release the reservation and record which reserved cubes were replicated
    virtual void end(const std::set<std::string>& replicated_cubes) = 0;

private:
    std::string id_;
    std::vector<std::string> cubes_to_optimize_;
};

class Keeper {
public:
    virtual ~Keeper() = default;

    virtual std::unique_ptr<WriteSession> begin_write(const std::string& table_id, RevisionID revision_id) = 0;

    virtual void announce(const std::string& table_id, RevisionID revision_id,
                          const std::vector<std::string>& cubes) = 0;

    // Up to cube_limit announced cubes that are neither replicated nor reserved
    virtual std::unique_ptr<OptimizationSession> begin_optimization(const std::string& table_id,
                                                                    RevisionID revision_id,
                                                                    size_t cube_limit) = 0;

    virtual void stop() = 0;
};

// Keeper backend named by keeper.backend ("local" or "postgres")
std::unique_ptr<Keeper> make_keeper();

std::set<CubeId> parse_cubes(const Revision& revision, const std::set<std::string>& cubes);
std::vector<std::string> cube_strings(const std::set<CubeId>& cubes);

} // namespace otree
