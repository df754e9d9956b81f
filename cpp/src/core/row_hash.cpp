#include "otree/row_hash.hpp"
#include "otree/murmur3.hpp"

namespace otree {

int32_t hash_value(const ColumnValue& value, QDataType type, int32_t seed) {
    if (is_null(value)) {
        return seed;
    }

    switch (type) {
        case QDataType::Int:
        case QDataType::Date:
            if (const auto* v = std::get_if<int64_t>(&value)) {
                return Murmur3::hash_int(static_cast<int32_t>(*v), seed);
            }
            break;
        case QDataType::Long:
        case QDataType::Timestamp:
            if (const auto* v = std::get_if<int64_t>(&value)) {
                return Murmur3::hash_long(*v, seed);
            }
            break;
        case QDataType::Float:
            if (const auto d = as_double(value)) {
                return Murmur3::hash_int(Murmur3::float_to_int_bits(static_cast<float>(*d)), seed);
            }
            break;
        case QDataType::Double:
            if (const auto d = as_double(value)) {
                return Murmur3::hash_long(Murmur3::double_to_long_bits(*d), seed);
            }
            break;
        case QDataType::Boolean:
            if (const auto* v = std::get_if<bool>(&value)) {
                return Murmur3::hash_int(*v ? 1 : 0, seed);
            }
            break;
        case QDataType::String:
            if (const auto* v = std::get_if<std::string>(&value)) {
                return Murmur3::hash_string(*v, seed);
            }
            break;
        case QDataType::Binary:
            if (const auto* v = std::get_if<Bytes>(&value)) {
                return Murmur3::hash_bytes(*v, seed);
            }
            break;
    }

    // Value held in a representation other than the declared type
    return Murmur3::hash_string(value_to_string(value), seed);
}

Weight row_weight(const Row& row, const Schema& schema, const std::vector<size_t>& columns) {
    int32_t hash = Murmur3::DEFAULT_SEED;
    for (size_t column : columns) {
        hash = hash_value(row[column], schema[column].type, hash);
    }
    return Weight(hash);
}

uint64_t row_identity(const Row& row, const Schema& schema) {
    int32_t lo = 0;
    int32_t hi = 1;
    for (size_t i = 0; i < row.size() && i < schema.size(); ++i) {
        lo = hash_value(row[i], schema[i].type, lo);
        hi = hash_value(row[i], schema[i].type, hi);
    }
    return (static_cast<uint64_t>(static_cast<uint32_t>(hi)) << 32) | static_cast<uint32_t>(lo);
}

} // namespace otree
