#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/json.hpp>

#include "otree/index_file.hpp"
#include "otree/revision.hpp"

namespace otree::metadata {

/**
 * JSON form of the persisted index metadata. CubeIds are stored as their
 * string form and weights as plain integers. Every decoder validates the
 * whole document and throws CorruptDataError instead of guessing.
 */

boost::json::value to_json(const Revision& revision);
boost::json::value to_json(const Block& block);
boost::json::value to_json(const IndexFile& file);
boost::json::value to_json(const DeleteFile& file);

Revision revision_from_json(const boost::json::value& json);
Block block_from_json(const boost::json::value& json, uint32_t dimensions);
IndexFile index_file_from_json(const boost::json::value& json, uint32_t dimensions);
DeleteFile delete_file_from_json(const boost::json::value& json);

std::string serialize_revision(const Revision& revision);
Revision parse_revision(std::string_view text);

std::string serialize_index_file(const IndexFile& file);
IndexFile parse_index_file(std::string_view text, uint32_t dimensions);

} // namespace otree::metadata
