#include "otree/column_stats.hpp"
#include "otree/error.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace otree {

ColumnStats ColumnStats::with_bounds(std::string column, QDataType type, double min, double max) {
    if (!(min <= max)) {
        throw InvalidArgumentError("Column stats for '" + column + "' have min > max or NaN bounds");
    }
    ColumnStats stats;
    stats.column = std::move(column);
    stats.type = type;
    stats.min = min;
    stats.max = max;
    return stats;
}

std::vector<ColumnStats> compute_column_stats(const RowBatch& batch, const std::vector<size_t>& columns) {
    std::vector<ColumnStats> out;
    out.reserve(columns.size());

    for (size_t column : columns) {
        if (column >= batch.schema.size()) {
            throw InvalidArgumentError("Column index out of range: " + std::to_string(column));
        }
        ColumnStats stats;
        stats.column = batch.schema[column].name;
        stats.type = batch.schema[column].type;
        stats.count = static_cast<int64_t>(batch.rows.size());

        if (!is_numeric(stats.type)) {
            for (const Row& row : batch.rows) {
                if (is_null(row[column])) ++stats.null_count;
            }
            out.push_back(std::move(stats));
            continue;
        }

        Eigen::ArrayXd values(static_cast<Eigen::Index>(batch.rows.size()));
        Eigen::Index n = 0;
        // NaN counts as null; infinities have no place in a linear domain
        for (const Row& row : batch.rows) {
            const auto v = as_double(row[column]);
            if (!v || std::isnan(*v)) {
                ++stats.null_count;
                continue;
            }
            if (std::isinf(*v)) {
                throw InvalidArgumentError("Column '" + stats.column + "' holds an infinite value");
            }
            values[n++] = *v;
        }
        if (n > 0) {
            auto observed = values.head(n);
            stats.min = observed.minCoeff();
            stats.max = observed.maxCoeff();
        }
        out.push_back(std::move(stats));
    }
    return out;
}

} // namespace otree
