#include "otree/keeper/keeper.hpp"
#include "otree/config.hpp"
#include "otree/error.hpp"
#include "otree/keeper/local_keeper.hpp"
#include "otree/keeper/pg_keeper.hpp"
#include "otree/logging.hpp"

namespace otree {

std::unique_ptr<Keeper> make_keeper() {
    const std::string backend = Config::getInstance().get<std::string>("keeper.backend", "local");
    if (backend == "local") {
        return std::make_unique<LocalKeeper>();
    }
    if (backend == "postgres") {
        return std::make_unique<PgKeeper>();
    }
    throw InvalidArgumentError("Unknown keeper backend '" + backend + "'", "keeper.backend",
                               "Use 'local' or 'postgres'");
}

std::set<CubeId> parse_cubes(const Revision& revision, const std::set<std::string>& cubes) {
    std::set<CubeId> out;
    for (const std::string& cube : cubes) {
        out.insert(revision.create_cube_id(std::string_view(cube)));
    }
    return out;
}

std::vector<std::string> cube_strings(const std::set<CubeId>& cubes) {
    std::vector<std::string> out;
    out.reserve(cubes.size());
    for (const CubeId& cube : cubes) {
        out.push_back(cube.to_string());
    }
    return out;
}

} // namespace otree
