#pragma once

#include <istream>
#include <string>

#include "otree/types.hpp"

namespace otree {

/**
 * Read a comma separated file into a batch. The header names the columns as
 * "name:type" (type as in parse_data_type, default Double). Empty cells are
 * null. Quoting is not supported.
 */
RowBatch read_csv(std::istream& in);
RowBatch read_csv_file(const std::string& path);

} // namespace otree
