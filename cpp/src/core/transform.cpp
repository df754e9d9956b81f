#include "otree/transform.hpp"
#include "otree/error.hpp"
#include "otree/murmur3.hpp"
#include "otree/row_hash.hpp"
#include "otree/weight.hpp"

#include <algorithm>
#include <cmath>

namespace otree {

namespace {

Transformation make_linear(const Transformer& transformer, const ColumnStats& stats) {
    std::optional<double> null_value;
    if (transformer.null_value()) {
        null_value = as_double(*transformer.null_value());
        if (!null_value || !std::isfinite(*null_value)) {
            throw InvalidArgumentError("Null value of linear column '" + transformer.column() +
                                       "' is not numeric");
        }
    }

    double min = 0.0;
    double max = 0.0;
    if (stats.has_bounds()) {
        min = *stats.min;
        max = *stats.max;
    } else if (null_value) {
        min = max = *null_value;
    }
    if (null_value) {
        min = std::min(min, *null_value);
        max = std::max(max, *null_value);
    }
    return Transformation(LinearTransformation{min, max, null_value, transformer.clamp()},
                          transformer.type());
}

Transformation make_hashing(const Transformer& transformer, const ColumnStats&) {
    return Transformation(HashTransformation{transformer.null_value()}, transformer.type());
}

constexpr TransformerType LINEAR_TYPE{"linear", &make_linear};
constexpr TransformerType HASHING_TYPE{"hashing", &make_hashing};

double hash_coordinate(const ColumnValue& value, QDataType type) {
    return Weight(hash_value(value, type, Murmur3::DEFAULT_SEED)).fraction();
}

double scale(const LinearTransformation& linear, double value) {
    if (linear.max == linear.min) {
        return 0.0;
    }
    double t = (value - linear.min) / (linear.max - linear.min);
    if (linear.clamp) {
        t = std::clamp(t, 0.0, 1.0);
    }
    return t;
}

} // anonymous namespace

const TransformerType& transformer_type(TransformerKind kind) noexcept {
    return kind == TransformerKind::Linear ? LINEAR_TYPE : HASHING_TYPE;
}

TransformerKind parse_transformer_kind(std::string_view name) {
    if (name == LINEAR_TYPE.name) return TransformerKind::Linear;
    if (name == HASHING_TYPE.name) return TransformerKind::Hashing;
    throw InvalidArgumentError("Unknown transformer type: " + std::string(name));
}

double Transformation::transform(const ColumnValue& value) const {
    if (is_missing(value) && !has_null_value()) {
        throw InvalidArgumentError("Missing value has no coordinate without a configured null value");
    }
    if (const auto* lin = linear()) {
        if (is_missing(value)) {
            return scale(*lin, *lin->null_value);
        }
        auto v = as_double(value);
        if (!v) {
            throw InvalidArgumentError("Linear transformation got a non-numeric value: " + value_to_string(value));
        }
        return scale(*lin, *v);
    }

    const auto& hash = std::get<HashTransformation>(impl_);
    return hash_coordinate(is_missing(value) ? *hash.null_value : value, type_);
}

bool Transformation::has_null_value() const noexcept {
    if (const auto* lin = linear()) {
        return lin->null_value.has_value();
    }
    return std::get<HashTransformation>(impl_).null_value.has_value();
}

bool Transformation::accepts(const ColumnStats& stats) const noexcept {
    const auto* lin = linear();
    if (!lin || lin->clamp || !stats.has_bounds()) {
        return true;
    }
    return *stats.min >= lin->min && *stats.max <= lin->max;
}

Transformation Transformation::widen(const ColumnStats& stats) const {
    const auto* lin = linear();
    if (!lin || !stats.has_bounds()) {
        return *this;
    }
    LinearTransformation wider = *lin;
    wider.min = std::min(wider.min, *stats.min);
    wider.max = std::max(wider.max, *stats.max);
    return Transformation(wider, type_);
}

Transformer Transformer::from_spec(std::string_view spec, const Schema& schema) {
    const size_t colon = spec.find(':');
    const Field& field = schema[schema.require_index(spec.substr(0, colon))];

    std::optional<TransformerKind> kind;
    std::optional<ColumnValue> null_value;
    bool clamp = false;
    std::string_view rest = colon == std::string_view::npos ? std::string_view{} : spec.substr(colon + 1);
    while (colon != std::string_view::npos) {
        const size_t next = rest.find(':');
        const std::string_view option = rest.substr(0, next);
        if (option.starts_with("null=")) {
            null_value = parse_value(option.substr(5), field.type);
            if (is_missing(*null_value)) {
                throw InvalidArgumentError("Null value of column '" + field.name + "' must not be empty");
            }
        } else if (option == "clamp") {
            clamp = true;
        } else {
            kind = parse_transformer_kind(option);
        }
        if (next == std::string_view::npos) break;
        rest = rest.substr(next + 1);
    }

    if (!kind) {
        kind = is_numeric(field.type) ? TransformerKind::Linear : TransformerKind::Hashing;
    }
    if (*kind == TransformerKind::Linear && !is_numeric(field.type)) {
        throw InvalidArgumentError("Column '" + field.name + "' of type " + to_string(field.type) +
                                   " cannot use a linear transformer");
    }
    return Transformer(field.name, field.type, *kind, std::move(null_value), clamp);
}

std::optional<Transformation> Transformer::maybe_update(const Transformation& current,
                                                        const ColumnStats& stats) const {
    if (current.accepts(stats)) {
        return std::nullopt;
    }
    return current.widen(stats);
}

} // namespace otree
