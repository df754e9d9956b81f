#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "otree/types.hpp"

namespace otree {

/**
 * Address of a node of the space-partition tree (a cube).
 *
 * A cube at depth k is the path of k child-selector digits from the root.
 * With d indexed dimensions every cube has 2^d children and each digit holds
 * one bit per dimension: bit (d - 1 - i) of the digit is the half of the
 * parent interval the cube takes on dimension i. The root is the empty path.
 *
 * Parent and child relations are derived by slicing or extending the path;
 * nothing is stored besides the digits.
 *
 * Binary layout (the persisted contract):
 *   byte 0        depth
 *   bytes 1..n    digits packed d bits each, most significant bit first,
 *                 zero-padded to a whole byte, n = ceil(depth * d / 8)
 */
class CubeId {
public:
    static constexpr uint32_t MAX_DIMENSIONS = 16;
    static constexpr uint32_t MAX_DEPTH = 48;

    CubeId() = default;
    CubeId(uint32_t dimensions, std::vector<uint32_t> digits);

    static CubeId root(uint32_t dimensions);

    // Finest cube at the given depth that contains the point
    static CubeId container(const Point& point, uint32_t depth);

    uint32_t dimensions() const noexcept { return dimensions_; }
    uint32_t depth() const noexcept { return static_cast<uint32_t>(digits_.size()); }
    const std::vector<uint32_t>& digits() const noexcept { return digits_; }
    bool is_root() const noexcept { return digits_.empty(); }

    std::optional<CubeId> parent() const;
    CubeId child(uint32_t digit) const;
    std::vector<CubeId> children() const;

    // Digit of the child of this cube that contains the point
    uint32_t child_digit(const Point& point) const;
    CubeId child_containing(const Point& point) const { return child(child_digit(point)); }

    // True when this cube is an ancestor of (or equal to) other
    bool contains(const CubeId& other) const noexcept;
    bool is_ancestor_of(const CubeId& other) const noexcept {
        return depth() < other.depth() && contains(other);
    }

    // Lower and upper corner of the cube's hyper-rectangle in [0, 1]^d
    Point from() const;
    Point to() const;
    bool intersects(const Point& lower, const Point& upper) const;

    std::vector<uint8_t> bytes() const;
    static CubeId from_bytes(uint32_t dimensions, std::span<const uint8_t> data);

    // Compact text form: ceil(d / 6) base64 characters per level, root is ""
    std::string to_string() const;
    static CubeId from_string(uint32_t dimensions, std::string_view text);

    bool operator==(const CubeId& other) const noexcept = default;
    std::strong_ordering operator<=>(const CubeId& other) const noexcept;

private:
    uint32_t dimensions_ = 0;
    std::vector<uint32_t> digits_;
};

std::ostream& operator<<(std::ostream& os, const CubeId& cube);

} // namespace otree

template<>
struct std::hash<otree::CubeId> {
    size_t operator()(const otree::CubeId& cube) const noexcept {
        size_t h = std::hash<uint32_t>{}(cube.dimensions());
        for (uint32_t digit : cube.digits()) {
            h ^= std::hash<uint32_t>{}(digit) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        h ^= std::hash<size_t>{}(cube.depth()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
