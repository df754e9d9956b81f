#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "otree/types.hpp"

namespace otree {

/**
 * Observed (or user supplied) statistics of one indexed column.
 * Nulls are counted but never take part in min/max.
 */
struct ColumnStats {
    std::string column;
    QDataType type = QDataType::Long;
    std::optional<double> min;
    std::optional<double> max;
    int64_t null_count = 0;
    int64_t count = 0;

    bool has_bounds() const noexcept { return min.has_value() && max.has_value(); }

    // Stats carrying only bounds, e.g. from a columnStats option
    static ColumnStats with_bounds(std::string column, QDataType type, double min, double max);
};

/**
 * Compute stats for the given columns of a batch. Numeric columns are
 * reduced with Eigen; other columns only report counts.
 */
std::vector<ColumnStats> compute_column_stats(const RowBatch& batch, const std::vector<size_t>& columns);

} // namespace otree
