#include "otree/types.hpp"
#include "otree/error.hpp"

#include <charconv>
#include <sstream>

namespace otree {

const char* to_string(QDataType type) noexcept {
    switch (type) {
        case QDataType::Int:       return "int";
        case QDataType::Long:      return "long";
        case QDataType::Float:     return "float";
        case QDataType::Double:    return "double";
        case QDataType::Boolean:   return "boolean";
        case QDataType::Date:      return "date";
        case QDataType::Timestamp: return "timestamp";
        case QDataType::String:    return "string";
        case QDataType::Binary:    return "binary";
    }
    return "unknown";
}

QDataType parse_data_type(std::string_view name) {
    if (name == "int" || name == "integer") return QDataType::Int;
    if (name == "long" || name == "bigint") return QDataType::Long;
    if (name == "float") return QDataType::Float;
    if (name == "double") return QDataType::Double;
    if (name == "boolean" || name == "bool") return QDataType::Boolean;
    if (name == "date") return QDataType::Date;
    if (name == "timestamp") return QDataType::Timestamp;
    if (name == "string") return QDataType::String;
    if (name == "binary") return QDataType::Binary;
    throw InvalidArgumentError("Unknown data type: " + std::string(name));
}

std::optional<double> as_double(const ColumnValue& value) noexcept {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

std::string value_to_string(const ColumnValue& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(const Bytes& v) const { return to_hex(v); }
    };
    return std::visit(Visitor{}, value);
}

std::string to_hex(const Bytes& bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

namespace {

Bytes parse_hex(std::string_view text) {
    auto nibble = [&](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw InvalidArgumentError("Not a hex string: '" + std::string(text) + "'");
    };
    if (text.size() % 2 != 0) {
        throw InvalidArgumentError("Hex string of odd length: '" + std::string(text) + "'");
    }
    Bytes out(text.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((nibble(text[2 * i]) << 4) | nibble(text[2 * i + 1]));
    }
    return out;
}

} // anonymous namespace

ColumnValue parse_value(std::string_view text, QDataType type) {
    if (text.empty()) {
        return std::monostate{};
    }
    switch (type) {
        case QDataType::Int:
        case QDataType::Long:
        case QDataType::Date:
        case QDataType::Timestamp: {
            int64_t out = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw InvalidArgumentError("Not an integer: '" + std::string(text) + "'");
            }
            return out;
        }
        case QDataType::Float:
        case QDataType::Double: {
            try {
                size_t consumed = 0;
                double out = std::stod(std::string(text), &consumed);
                if (consumed != text.size()) {
                    throw InvalidArgumentError("Not a number: '" + std::string(text) + "'");
                }
                return out;
            } catch (const std::logic_error&) {
                throw InvalidArgumentError("Not a number: '" + std::string(text) + "'");
            }
        }
        case QDataType::Boolean:
            if (text == "true" || text == "1") return true;
            if (text == "false" || text == "0") return false;
            throw InvalidArgumentError("Not a boolean: '" + std::string(text) + "'");
        case QDataType::String:
            return std::string(text);
        case QDataType::Binary:
            return parse_hex(text);
    }
    return std::monostate{};
}

std::optional<size_t> Schema::index_of(std::string_view name) const noexcept {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

size_t Schema::require_index(std::string_view name) const {
    auto idx = index_of(name);
    if (!idx) {
        throw InvalidArgumentError("Column not found in schema: " + std::string(name));
    }
    return *idx;
}

bool Schema::operator==(const Schema& other) const {
    if (fields_.size() != other.fields_.size()) return false;
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name != other.fields_[i].name || fields_[i].type != other.fields_[i].type) {
            return false;
        }
    }
    return true;
}

} // namespace otree
