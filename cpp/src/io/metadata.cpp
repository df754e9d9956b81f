#include "otree/io/metadata.hpp"
#include "otree/error.hpp"

#include <limits>

namespace otree::metadata {

namespace json = boost::json;

namespace {

// ============================================================================
// Field access with validation
// ============================================================================

const json::object& require_object(const json::value& value, const char* what) {
    const json::object* obj = value.if_object();
    if (!obj) {
        OTREE_THROW_CORRUPT(std::string(what) + " is not a JSON object");
    }
    return *obj;
}

const json::value& require(const json::object& obj, const char* key) {
    const json::value* value = obj.if_contains(key);
    if (!value) {
        OTREE_THROW_CORRUPT(std::string("Missing field '") + key + "'");
    }
    return *value;
}

int64_t require_int(const json::object& obj, const char* key) {
    const json::value& value = require(obj, key);
    if (value.is_int64()) return value.get_int64();
    if (value.is_uint64() && value.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(value.get_uint64());
    }
    OTREE_THROW_CORRUPT(std::string("Field '") + key + "' is not an integer");
}

double require_double(const json::object& obj, const char* key) {
    const json::value& value = require(obj, key);
    if (value.is_double()) return value.get_double();
    if (value.is_int64()) return static_cast<double>(value.get_int64());
    if (value.is_uint64()) return static_cast<double>(value.get_uint64());
    OTREE_THROW_CORRUPT(std::string("Field '") + key + "' is not a number");
}

bool require_bool(const json::object& obj, const char* key) {
    const json::value& value = require(obj, key);
    if (!value.is_bool()) {
        OTREE_THROW_CORRUPT(std::string("Field '") + key + "' is not a boolean");
    }
    return value.get_bool();
}

std::string require_string(const json::object& obj, const char* key) {
    const json::value& value = require(obj, key);
    if (!value.is_string()) {
        OTREE_THROW_CORRUPT(std::string("Field '") + key + "' is not a string");
    }
    return std::string(value.get_string());
}

const json::array& require_array(const json::object& obj, const char* key) {
    const json::value& value = require(obj, key);
    if (!value.is_array()) {
        OTREE_THROW_CORRUPT(std::string("Field '") + key + "' is not an array");
    }
    return value.get_array();
}

Weight require_weight(const json::object& obj, const char* key) {
    const int64_t value = require_int(obj, key);
    if (value < Weight::MIN_INT || value > Weight::MAX_INT) {
        OTREE_THROW_CORRUPT(std::string("Weight '") + key + "' out of range: " + std::to_string(value));
    }
    return Weight(static_cast<int32_t>(value));
}

template<typename F>
auto rethrow_as_corrupt(F&& parse) {
    try {
        return parse();
    } catch (const InvalidArgumentError& e) {
        OTREE_THROW_CORRUPT(e.what());
    }
}

// ============================================================================
// Values
// ============================================================================

json::value value_to_json(const ColumnValue& value) {
    return std::visit([](const auto& v) -> json::value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return json::string(v);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return json::string(to_hex(v));
        } else {
            return v;
        }
    }, value);
}

ColumnValue value_from_json(const json::value& value, QDataType type) {
    if (value.is_null()) return std::monostate{};
    switch (type) {
        case QDataType::Int:
        case QDataType::Long:
        case QDataType::Date:
        case QDataType::Timestamp:
            if (value.is_int64()) return value.get_int64();
            break;
        case QDataType::Float:
        case QDataType::Double:
            if (value.is_double()) return value.get_double();
            if (value.is_int64()) return static_cast<double>(value.get_int64());
            break;
        case QDataType::Boolean:
            if (value.is_bool()) return value.get_bool();
            break;
        case QDataType::String:
            if (value.is_string()) return std::string(value.get_string());
            break;
        case QDataType::Binary:
            if (value.is_string()) {
                return rethrow_as_corrupt([&] { return parse_value(value.get_string(), type); });
            }
            break;
    }
    OTREE_THROW_CORRUPT(std::string("Null value does not match column type ") + to_string(type));
}

json::value optional_double(const std::optional<double>& value) {
    return value ? json::value(*value) : json::value(nullptr);
}

// ============================================================================
// Transformers
// ============================================================================

json::value transformer_to_json(const Transformer& t) {
    json::object obj;
    obj["column"] = t.column();
    obj["type"] = to_string(t.type());
    obj["kind"] = t.name();
    obj["nullValue"] = t.null_value() ? value_to_json(*t.null_value()) : json::value(nullptr);
    obj["clamp"] = t.clamp();
    return obj;
}

Transformer transformer_from_json(const json::value& value) {
    const json::object& obj = require_object(value, "Column transformer");
    const QDataType type = rethrow_as_corrupt([&] { return parse_data_type(require_string(obj, "type")); });
    const TransformerKind kind = rethrow_as_corrupt([&] { return parse_transformer_kind(require_string(obj, "kind")); });
    std::optional<ColumnValue> null_value;
    const json::value& null_json = require(obj, "nullValue");
    if (!null_json.is_null()) {
        null_value = value_from_json(null_json, type);
    }
    return Transformer(require_string(obj, "column"), type, kind, std::move(null_value), require_bool(obj, "clamp"));
}

json::value transformation_to_json(const Transformation& t) {
    json::object obj;
    if (const LinearTransformation* linear = t.linear()) {
        obj["kind"] = "linear";
        obj["min"] = linear->min;
        obj["max"] = linear->max;
        obj["nullValue"] = optional_double(linear->null_value);
        obj["clamp"] = linear->clamp;
    } else {
        obj["kind"] = "hashing";
        const auto& null_value = t.hashing()->null_value;
        obj["nullValue"] = null_value ? value_to_json(*null_value) : json::value(nullptr);
    }
    return obj;
}

Transformation transformation_from_json(const json::value& value, QDataType type) {
    const json::object& obj = require_object(value, "Transformation");
    const std::string kind = require_string(obj, "kind");
    const json::value& null_json = require(obj, "nullValue");

    if (kind == "linear") {
        LinearTransformation linear;
        linear.min = require_double(obj, "min");
        linear.max = require_double(obj, "max");
        if (linear.min > linear.max) {
            OTREE_THROW_CORRUPT("Linear transformation has min > max");
        }
        if (!null_json.is_null()) {
            linear.null_value = require_double(obj, "nullValue");
        }
        linear.clamp = require_bool(obj, "clamp");
        return Transformation(linear, type);
    }
    if (kind == "hashing") {
        HashTransformation hash;
        if (!null_json.is_null()) {
            hash.null_value = value_from_json(null_json, type);
        }
        return Transformation(hash, type);
    }
    OTREE_THROW_CORRUPT("Unknown transformation kind '" + kind + "'");
}

json::value parse_document(std::string_view text) {
    boost::system::error_code ec;
    json::value value = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        OTREE_THROW_CORRUPT("Malformed JSON: " + ec.message());
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// Revision
// ============================================================================

json::value to_json(const Revision& revision) {
    json::object obj;
    obj["revisionId"] = revision.revision_id;
    obj["tableId"] = revision.table_id;
    obj["timestamp"] = revision.timestamp;
    obj["desiredCubeSize"] = revision.desired_cube_size;

    json::array transformers;
    for (const auto& t : revision.column_transformers) {
        transformers.push_back(transformer_to_json(t));
    }
    obj["columnTransformers"] = std::move(transformers);

    json::array transformations;
    for (const auto& t : revision.transformations) {
        transformations.push_back(transformation_to_json(t));
    }
    obj["transformations"] = std::move(transformations);
    return obj;
}

Revision revision_from_json(const json::value& value) {
    const json::object& obj = require_object(value, "Revision");

    Revision revision;
    revision.revision_id = require_int(obj, "revisionId");
    revision.table_id = require_string(obj, "tableId");
    revision.timestamp = require_int(obj, "timestamp");
    revision.desired_cube_size = require_int(obj, "desiredCubeSize");
    if (revision.revision_id <= 0 || revision.desired_cube_size <= 0) {
        OTREE_THROW_CORRUPT("Revision id and desired cube size must be positive");
    }

    for (const json::value& t : require_array(obj, "columnTransformers")) {
        revision.column_transformers.push_back(transformer_from_json(t));
    }
    const json::array& transformations = require_array(obj, "transformations");
    if (transformations.size() != revision.column_transformers.size()) {
        OTREE_THROW_CORRUPT("Revision has " + std::to_string(revision.column_transformers.size()) +
                            " transformers but " + std::to_string(transformations.size()) + " transformations");
    }
    if (revision.column_transformers.empty() || revision.column_transformers.size() > CubeId::MAX_DIMENSIONS) {
        OTREE_THROW_CORRUPT("Revision has an invalid number of indexed columns");
    }
    for (size_t i = 0; i < transformations.size(); ++i) {
        const Transformer& transformer = revision.column_transformers[i];
        Transformation t = transformation_from_json(transformations[i], transformer.type());
        if (t.kind() != transformer.kind()) {
            OTREE_THROW_CORRUPT("Transformation of column '" + transformer.column() + "' has the wrong kind");
        }
        revision.transformations.push_back(std::move(t));
    }
    return revision;
}

// ============================================================================
// Files
// ============================================================================

json::value to_json(const Block& block) {
    json::object obj;
    obj["cubeId"] = block.cube.to_string();
    obj["minWeight"] = block.min_weight.value;
    obj["maxWeight"] = block.max_weight.value;
    obj["elementCount"] = block.element_count;
    obj["replicated"] = block.replicated;
    return obj;
}

Block block_from_json(const json::value& value, uint32_t dimensions) {
    const json::object& obj = require_object(value, "Block");
    Block block;
    block.cube = CubeId::from_string(dimensions, require_string(obj, "cubeId"));
    block.min_weight = require_weight(obj, "minWeight");
    block.max_weight = require_weight(obj, "maxWeight");
    block.element_count = require_int(obj, "elementCount");
    block.replicated = require_bool(obj, "replicated");
    if (block.element_count < 0) {
        OTREE_THROW_CORRUPT("Block of cube '" + block.cube.to_string() + "' has a negative element count");
    }
    return block;
}

json::value to_json(const IndexFile& file) {
    json::object obj;
    obj["path"] = file.path;
    obj["size"] = file.size;
    obj["dataChange"] = file.data_change;
    obj["modificationTime"] = file.modification_time;
    obj["revisionId"] = file.revision_id;
    json::array blocks;
    for (const Block& block : file.blocks) {
        blocks.push_back(to_json(block));
    }
    obj["blocks"] = std::move(blocks);
    obj["stats"] = file.stats ? json::value(*file.stats) : json::value(nullptr);
    return obj;
}

IndexFile index_file_from_json(const json::value& value, uint32_t dimensions) {
    const json::object& obj = require_object(value, "IndexFile");
    IndexFile file;
    file.path = require_string(obj, "path");
    file.size = require_int(obj, "size");
    file.data_change = require_bool(obj, "dataChange");
    file.modification_time = require_int(obj, "modificationTime");
    file.revision_id = require_int(obj, "revisionId");
    for (const json::value& block : require_array(obj, "blocks")) {
        file.blocks.push_back(block_from_json(block, dimensions));
    }
    const json::value& stats = require(obj, "stats");
    if (stats.is_string()) {
        file.stats = std::string(stats.get_string());
    } else if (!stats.is_null()) {
        OTREE_THROW_CORRUPT("Field 'stats' of '" + file.path + "' is neither a string nor null");
    }
    return file;
}

json::value to_json(const DeleteFile& file) {
    json::object obj;
    obj["path"] = file.path;
    obj["size"] = file.size;
    obj["dataChange"] = file.data_change;
    obj["deletionTimestamp"] = file.deletion_timestamp;
    return obj;
}

DeleteFile delete_file_from_json(const json::value& value) {
    const json::object& obj = require_object(value, "DeleteFile");
    DeleteFile file;
    file.path = require_string(obj, "path");
    file.size = require_int(obj, "size");
    file.data_change = require_bool(obj, "dataChange");
    file.deletion_timestamp = require_int(obj, "deletionTimestamp");
    return file;
}

std::string serialize_revision(const Revision& revision) {
    return json::serialize(to_json(revision));
}

Revision parse_revision(std::string_view text) {
    return revision_from_json(parse_document(text));
}

std::string serialize_index_file(const IndexFile& file) {
    return json::serialize(to_json(file));
}

IndexFile parse_index_file(std::string_view text, uint32_t dimensions) {
    return index_file_from_json(parse_document(text), dimensions);
}

} // namespace otree::metadata
