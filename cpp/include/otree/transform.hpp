#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "otree/column_stats.hpp"
#include "otree/types.hpp"

namespace otree {

/**
 * Column normalization.
 *
 * A Transformer describes how one indexed column is normalized; given column
 * statistics it produces a Transformation, the revision-scoped function that
 * maps a value to a coordinate in [0, 1]. The set of kinds is closed:
 *
 *   linear   (value - min) / (max - min), for ordered numeric domains
 *   hashing  Murmur3(value) as a fraction, for domains without useful order
 *
 * Transformations never change after creation. A value outside a linear
 * transformation's bounds supersedes it (a new revision is needed) unless the
 * transformer clamps.
 */

enum class TransformerKind {
    Linear,
    Hashing
};

struct LinearTransformation {
    double min = 0.0;
    double max = 0.0;
    std::optional<double> null_value;  // coordinate source for nulls
    bool clamp = false;

    bool operator==(const LinearTransformation&) const = default;
};

struct HashTransformation {
    std::optional<ColumnValue> null_value;

    bool operator==(const HashTransformation&) const = default;
};

class Transformation {
public:
    Transformation() = default;
    explicit Transformation(LinearTransformation linear, QDataType type)
        : type_(type), impl_(std::move(linear)) {}
    explicit Transformation(HashTransformation hash, QDataType type)
        : type_(type), impl_(std::move(hash)) {}

    TransformerKind kind() const noexcept {
        return std::holds_alternative<LinearTransformation>(impl_) ? TransformerKind::Linear
                                                                   : TransformerKind::Hashing;
    }
    QDataType type() const noexcept { return type_; }

    const LinearTransformation* linear() const noexcept { return std::get_if<LinearTransformation>(&impl_); }
    const HashTransformation* hashing() const noexcept { return std::get_if<HashTransformation>(&impl_); }

    /**
     * Coordinate of a value. Missing values (null or NaN) take the coordinate
     * of the configured null value; without one they have no coordinate and
     * the call throws InvalidArgumentError. Revision::transform spreads such
     * rows instead.
     */
    double transform(const ColumnValue& value) const;

    bool has_null_value() const noexcept;

    // True when the observed bounds fit inside this transformation
    bool accepts(const ColumnStats& stats) const noexcept;

    // Smallest transformation covering both this one and the stats
    Transformation widen(const ColumnStats& stats) const;

    bool operator==(const Transformation&) const = default;

private:
    QDataType type_ = QDataType::Long;
    std::variant<LinearTransformation, HashTransformation> impl_;
};

class Transformer;

// Fixed vtable of one transformer kind
struct TransformerType {
    const char* name;
    Transformation (*make_transformation)(const Transformer& transformer, const ColumnStats& stats);
};

const TransformerType& transformer_type(TransformerKind kind) noexcept;
TransformerKind parse_transformer_kind(std::string_view name);

class Transformer {
public:
    Transformer() = default;
    Transformer(std::string column, QDataType type, TransformerKind kind,
                std::optional<ColumnValue> null_value = std::nullopt, bool clamp = false)
        : column_(std::move(column)), type_(type), kind_(kind),
          null_value_(std::move(null_value)), clamp_(clamp) {}

    /**
     * Transformer for a column spec "name[:option]...". Options are a kind
     * ("linear" or "hashing"), "clamp", and "null=<value>" where the value is
     * parsed as the column's type. Without an explicit kind, numeric and
     * temporal columns are linear and everything else is hashed.
     */
    static Transformer from_spec(std::string_view spec, const Schema& schema);

    const std::string& column() const noexcept { return column_; }
    QDataType type() const noexcept { return type_; }
    TransformerKind kind() const noexcept { return kind_; }
    const std::optional<ColumnValue>& null_value() const noexcept { return null_value_; }
    bool clamp() const noexcept { return clamp_; }
    const char* name() const noexcept { return transformer_type(kind_).name; }

    Transformation make_transformation(const ColumnStats& stats) const {
        return transformer_type(kind_).make_transformation(*this, stats);
    }

    // Widened transformation when stats fall outside current, nullopt otherwise
    std::optional<Transformation> maybe_update(const Transformation& current, const ColumnStats& stats) const;

    bool operator==(const Transformer&) const = default;

private:
    std::string column_;
    QDataType type_ = QDataType::Long;
    TransformerKind kind_ = TransformerKind::Linear;
    std::optional<ColumnValue> null_value_;
    bool clamp_ = false;
};

} // namespace otree
