#pragma once

#include <cstdint>
#include <vector>

#include "otree/types.hpp"
#include "otree/weight.hpp"

namespace otree {

/**
 * Spark-compatible hash of one value, chained from seed.
 * Null leaves the seed unchanged so rows differing only by null columns
 * behave like the Spark expression.
 */
int32_t hash_value(const ColumnValue& value, QDataType type, int32_t seed);

/**
 * Weight of a row: chained Murmur3 (seed 42) over the raw values of the
 * indexed columns, in column order. Independent of the revision: only raw
 * values take part, never normalized coordinates.
 */
Weight row_weight(const Row& row, const Schema& schema, const std::vector<size_t>& columns);

// 64-bit identity of a whole row, used as a deterministic tie-break
uint64_t row_identity(const Row& row, const Schema& schema);

} // namespace otree
