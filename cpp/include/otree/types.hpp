#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace otree {

// Column data types understood by the transformers
enum class QDataType {
    Int,        // 32-bit signed
    Long,       // 64-bit signed
    Float,
    Double,
    Boolean,
    Date,       // days since epoch
    Timestamp,  // microseconds since epoch
    String,
    Binary
};

const char* to_string(QDataType type) noexcept;
QDataType parse_data_type(std::string_view name);

// Types with a meaningful order on which linear scaling applies
constexpr bool is_numeric(QDataType type) noexcept {
    return type != QDataType::String && type != QDataType::Boolean && type != QDataType::Binary;
}

using Bytes = std::vector<uint8_t>;

/**
 * One cell of a row. Integers (Int, Long, Date, Timestamp) are held as
 * int64_t, Float and Double as double, Binary as Bytes.
 */
using ColumnValue = std::variant<std::monostate, int64_t, double, bool, std::string, Bytes>;

inline bool is_null(const ColumnValue& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// Null, or a floating point NaN; neither has a position in an ordered domain
inline bool is_missing(const ColumnValue& value) noexcept {
    if (const auto* d = std::get_if<double>(&value)) {
        return std::isnan(*d);
    }
    return is_null(value);
}

// Numeric view of a value, nullopt for null and non-numeric values
std::optional<double> as_double(const ColumnValue& value) noexcept;

std::string value_to_string(const ColumnValue& value);

// Lower-case hex form of a binary value
std::string to_hex(const Bytes& bytes);

// Parse a textual cell into a value of the given type; empty text is null.
// Binary cells are hex.
ColumnValue parse_value(std::string_view text, QDataType type);

struct Field {
    std::string name;
    QDataType type = QDataType::Long;
};

class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Field> fields) : fields_(std::move(fields)) {}

    const std::vector<Field>& fields() const noexcept { return fields_; }
    size_t size() const noexcept { return fields_.size(); }
    const Field& operator[](size_t i) const { return fields_[i]; }

    std::optional<size_t> index_of(std::string_view name) const noexcept;
    size_t require_index(std::string_view name) const;

    bool operator==(const Schema& other) const;

private:
    std::vector<Field> fields_;
};

using Row = std::vector<ColumnValue>;

// A batch of rows sharing one schema
struct RowBatch {
    Schema schema;
    std::vector<Row> rows;

    size_t size() const noexcept { return rows.size(); }
    bool empty() const noexcept { return rows.empty(); }
};

// Normalized coordinates of a row, one per indexed column, each in [0, 1]
using Point = std::vector<double>;

} // namespace otree
