#include "otree/query/file_selector.hpp"
#include "otree/error.hpp"
#include "otree/logging.hpp"

#include <algorithm>
#include <set>

namespace otree {

FileSelector::FileSelector(const IndexStatus& status, const std::vector<IndexFile>& files)
    : status_(status), files_(files) {}

std::set<CubeId> FileSelector::present_children(const CubeId& cube) const {
    std::set<CubeId> out;
    const auto prefix = static_cast<std::ptrdiff_t>(cube.depth() + 1);
    for (auto it = status_.cubes.upper_bound(cube);
         it != status_.cubes.end() && cube.is_ancestor_of(it->first); ++it) {
        const auto& digits = it->first.digits();
        out.insert(CubeId(cube.dimensions(), std::vector<uint32_t>(digits.begin(), digits.begin() + prefix)));
    }
    return out;
}

void FileSelector::visit(const CubeId& cube, Weight lower, Weight upper, const Point& from, const Point& to,
                         std::vector<std::string>& out) const {
    if (!cube.intersects(from, to)) return;

    auto below_upper = [upper](Weight w) { return upper == Weight::MaxValue || w < upper; };

    const CubeStatus* cube_status = status_.find(cube);
    if (cube_status && below_upper(cube_status->min_weight)) {
        for (const IndexFile& file : files_) {
            if (file.revision_id != status_.revision.revision_id) continue;
            for (const Block& block : file.blocks) {
                if (block.cube == cube && !block.replicated && below_upper(block.min_weight) &&
                    block.max_weight >= lower) {
                    out.push_back(file.path);
                    break;
                }
            }
        }
    }

    const Weight threshold = cube_status ? cube_status->max_weight : Weight::MinValue;
    if (threshold < upper) {
        for (const CubeId& child : present_children(cube)) {
            visit(child, lower, upper, from, to, out);
        }
    }
}

std::vector<std::string> FileSelector::select(double sample_lower, double sample_upper,
                                              const std::vector<ColumnFilter>& filters) const {
    OTREE_CHECK_ARGUMENT(sample_lower >= 0.0 && sample_lower <= sample_upper && sample_upper <= 1.0,
                         "sample range must satisfy 0 <= lower <= upper <= 1");

    const Revision& revision = status_.revision;
    const uint32_t dims = revision.dimensions();
    Point from(dims, 0.0);
    Point to(dims, 1.0);

    for (const ColumnFilter& filter : filters) {
        size_t i = 0;
        while (i < dims && revision.column_transformers[i].column() != filter.column) ++i;
        if (i == dims) {
            throw InvalidArgumentError("Column '" + filter.column + "' is not indexed");
        }
        const Transformation& transformation = revision.transformations[i];
        // A missing bound leaves that side open
        if (transformation.kind() == TransformerKind::Linear) {
            if (!is_missing(filter.lower)) from[i] = std::max(from[i], transformation.transform(filter.lower));
            if (!is_missing(filter.upper)) to[i] = std::min(to[i], transformation.transform(filter.upper));
        } else if (filter.lower == filter.upper && !is_missing(filter.lower)) {
            const double c = transformation.transform(filter.lower);
            from[i] = std::max(from[i], c);
            to[i] = std::min(to[i], c);
        }
        if (from[i] > to[i]) {
            return {};
        }
    }

    // A fraction of 1.0 reads every row, including weight MAX_INT
    const Weight lower = Weight::from_fraction(sample_lower);
    const Weight upper = sample_upper >= 1.0 ? Weight::MaxValue : Weight::from_fraction(sample_upper);

    std::vector<std::string> out;
    if (dims > 0) {
        visit(revision.root(), lower, upper, from, to, out);
    }

    std::set<std::string> seen;
    std::erase_if(out, [&](const std::string& path) { return !seen.insert(path).second; });
    LOG_DEBUG("Selected ", out.size(), " files for sample [", sample_lower, ", ", sample_upper, ")");
    return out;
}

} // namespace otree
