#include "otree/cube_id.hpp"
#include "otree/error.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>

namespace otree {

namespace {

constexpr char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

uint32_t chars_per_level(uint32_t dimensions) {
    return (dimensions + 5) / 6;
}

// Cell index of a coordinate on a grid of 2^level cells per side
uint64_t cell_of(double coordinate, uint32_t level) {
    const double cells = std::ldexp(1.0, static_cast<int>(level));
    double scaled = std::floor(coordinate * cells);
    if (!(scaled >= 0.0)) return 0;  // negative or NaN
    const uint64_t last = static_cast<uint64_t>(cells) - 1;
    if (scaled >= cells) return last;
    return std::min(static_cast<uint64_t>(scaled), last);
}

void check_dimensions(uint32_t dimensions) {
    if (dimensions == 0 || dimensions > CubeId::MAX_DIMENSIONS) {
        throw InvalidArgumentError("CubeId dimension count out of range: " + std::to_string(dimensions));
    }
}

} // anonymous namespace

CubeId::CubeId(uint32_t dimensions, std::vector<uint32_t> digits)
    : dimensions_(dimensions), digits_(std::move(digits)) {
    check_dimensions(dimensions);
    if (digits_.size() > MAX_DEPTH) {
        throw InvalidArgumentError("CubeId depth exceeds maximum: " + std::to_string(digits_.size()));
    }
    const uint32_t limit = 1U << dimensions;
    for (uint32_t digit : digits_) {
        if (digit >= limit) {
            throw InvalidArgumentError("CubeId digit " + std::to_string(digit) +
                                       " out of range for " + std::to_string(dimensions) + " dimensions");
        }
    }
}

CubeId CubeId::root(uint32_t dimensions) {
    return CubeId(dimensions, {});
}

CubeId CubeId::container(const Point& point, uint32_t depth) {
    if (depth > MAX_DEPTH) {
        throw InvalidArgumentError("Requested depth exceeds maximum: " + std::to_string(depth));
    }
    CubeId cube = root(static_cast<uint32_t>(point.size()));
    for (uint32_t level = 0; level < depth; ++level) {
        cube.digits_.push_back(cube.child_digit(point));
    }
    return cube;
}

std::optional<CubeId> CubeId::parent() const {
    if (is_root()) {
        return std::nullopt;
    }
    CubeId out;
    out.dimensions_ = dimensions_;
    out.digits_.assign(digits_.begin(), digits_.end() - 1);
    return out;
}

CubeId CubeId::child(uint32_t digit) const {
    if (digit >= (1U << dimensions_)) {
        throw InvalidArgumentError("Child digit out of range: " + std::to_string(digit));
    }
    if (depth() >= MAX_DEPTH) {
        throw InvalidArgumentError("Cannot descend below maximum depth");
    }
    CubeId out;
    out.dimensions_ = dimensions_;
    out.digits_.reserve(digits_.size() + 1);
    out.digits_.insert(out.digits_.end(), digits_.begin(), digits_.end());
    out.digits_.push_back(digit);
    return out;
}

std::vector<CubeId> CubeId::children() const {
    std::vector<CubeId> out;
    const uint32_t count = 1U << dimensions_;
    out.reserve(count);
    for (uint32_t digit = 0; digit < count; ++digit) {
        out.push_back(child(digit));
    }
    return out;
}

uint32_t CubeId::child_digit(const Point& point) const {
    if (point.size() != dimensions_) {
        throw InvalidArgumentError("Point has " + std::to_string(point.size()) +
                                   " coordinates, cube has " + std::to_string(dimensions_) + " dimensions");
    }
    const uint32_t level = depth() + 1;
    uint32_t digit = 0;
    for (uint32_t i = 0; i < dimensions_; ++i) {
        uint32_t bit = static_cast<uint32_t>(cell_of(point[i], level) & 1ULL);
        digit |= bit << (dimensions_ - 1 - i);
    }
    return digit;
}

bool CubeId::contains(const CubeId& other) const noexcept {
    if (dimensions_ != other.dimensions_ || depth() > other.depth()) {
        return false;
    }
    return std::equal(digits_.begin(), digits_.end(), other.digits_.begin());
}

Point CubeId::from() const {
    Point lower(dimensions_, 0.0);
    for (uint32_t level = 0; level < depth(); ++level) {
        const double half = std::ldexp(1.0, -static_cast<int>(level + 1));
        for (uint32_t i = 0; i < dimensions_; ++i) {
            if ((digits_[level] >> (dimensions_ - 1 - i)) & 1U) {
                lower[i] += half;
            }
        }
    }
    return lower;
}

Point CubeId::to() const {
    Point upper = from();
    const double width = std::ldexp(1.0, -static_cast<int>(depth()));
    for (double& value : upper) {
        value += width;
    }
    return upper;
}

bool CubeId::intersects(const Point& lower, const Point& upper) const {
    Point cube_from = from();
    Point cube_to = to();
    for (uint32_t i = 0; i < dimensions_; ++i) {
        // Cubes are half-open except the last cell, which also owns 1.0
        bool closed_end = cube_to[i] >= 1.0;
        if (upper[i] < cube_from[i]) return false;
        if (closed_end ? lower[i] > cube_to[i] : lower[i] >= cube_to[i]) return false;
    }
    return true;
}

std::vector<uint8_t> CubeId::bytes() const {
    const size_t bit_count = static_cast<size_t>(depth()) * dimensions_;
    std::vector<uint8_t> out(1 + (bit_count + 7) / 8, 0);
    out[0] = static_cast<uint8_t>(depth());

    size_t bit_pos = 0;
    for (uint32_t digit : digits_) {
        for (int b = static_cast<int>(dimensions_) - 1; b >= 0; --b, ++bit_pos) {
            if ((digit >> b) & 1U) {
                out[1 + bit_pos / 8] |= static_cast<uint8_t>(0x80U >> (bit_pos % 8));
            }
        }
    }
    return out;
}

CubeId CubeId::from_bytes(uint32_t dimensions, std::span<const uint8_t> data) {
    check_dimensions(dimensions);
    if (data.empty()) {
        OTREE_THROW_CORRUPT("Empty CubeId encoding");
    }
    const uint32_t depth = data[0];
    if (depth > MAX_DEPTH) {
        OTREE_THROW_CORRUPT("CubeId depth " + std::to_string(depth) + " exceeds maximum");
    }
    const size_t bit_count = static_cast<size_t>(depth) * dimensions;
    const size_t expected = 1 + (bit_count + 7) / 8;
    if (data.size() != expected) {
        OTREE_THROW_CORRUPT("CubeId encoding has " + std::to_string(data.size()) +
                            " bytes, expected " + std::to_string(expected));
    }

    std::vector<uint32_t> digits;
    digits.reserve(depth);
    size_t bit_pos = 0;
    for (uint32_t level = 0; level < depth; ++level) {
        uint32_t digit = 0;
        for (uint32_t b = 0; b < dimensions; ++b, ++bit_pos) {
            uint32_t bit = (data[1 + bit_pos / 8] >> (7 - bit_pos % 8)) & 1U;
            digit = (digit << 1) | bit;
        }
        digits.push_back(digit);
    }
    for (; bit_pos < (expected - 1) * 8; ++bit_pos) {
        if ((data[1 + bit_pos / 8] >> (7 - bit_pos % 8)) & 1U) {
            OTREE_THROW_CORRUPT("CubeId encoding has non-zero padding bits");
        }
    }
    return CubeId(dimensions, std::move(digits));
}

std::string CubeId::to_string() const {
    const uint32_t per_level = chars_per_level(dimensions_);
    std::string out;
    out.reserve(digits_.size() * per_level);
    for (uint32_t digit : digits_) {
        for (int c = static_cast<int>(per_level) - 1; c >= 0; --c) {
            out.push_back(BASE64_CHARS[(digit >> (6 * c)) & 0x3FU]);
        }
    }
    return out;
}

CubeId CubeId::from_string(uint32_t dimensions, std::string_view text) {
    check_dimensions(dimensions);
    const uint32_t per_level = chars_per_level(dimensions);
    if (text.size() % per_level != 0) {
        OTREE_THROW_CORRUPT("CubeId string '" + std::string(text) + "' has a partial level");
    }
    const size_t depth = text.size() / per_level;
    if (depth > MAX_DEPTH) {
        OTREE_THROW_CORRUPT("CubeId string '" + std::string(text) + "' exceeds maximum depth");
    }

    std::vector<uint32_t> digits;
    digits.reserve(depth);
    for (size_t level = 0; level < depth; ++level) {
        uint32_t digit = 0;
        for (uint32_t c = 0; c < per_level; ++c) {
            int v = base64_value(text[level * per_level + c]);
            if (v < 0) {
                OTREE_THROW_CORRUPT("Invalid character in CubeId string '" + std::string(text) + "'");
            }
            digit = (digit << 6) | static_cast<uint32_t>(v);
        }
        if (digit >= (1U << dimensions)) {
            OTREE_THROW_CORRUPT("CubeId string '" + std::string(text) + "' has a digit out of range");
        }
        digits.push_back(digit);
    }
    return CubeId(dimensions, std::move(digits));
}

std::strong_ordering CubeId::operator<=>(const CubeId& other) const noexcept {
    if (auto cmp = dimensions_ <=> other.dimensions_; cmp != 0) {
        return cmp;
    }
    return std::lexicographical_compare_three_way(
        digits_.begin(), digits_.end(), other.digits_.begin(), other.digits_.end());
}

std::ostream& operator<<(std::ostream& os, const CubeId& cube) {
    os << "CubeId(" << cube.dimensions() << ", " << cube.depth() << ", '" << cube.to_string() << "')";
    return os;
}

} // namespace otree
