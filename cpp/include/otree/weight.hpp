#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <ostream>

namespace otree {

/**
 * Sampling priority of a row: a 32-bit signed integer uniformly distributed
 * over its range. Lower weights stay in shallower cubes.
 *
 * fraction() maps the integer to [0, 1] with
 *   (value - MIN) / (MAX - MIN)
 * and Weight::MaxValue means "no upper threshold".
 */
struct Weight {
    static constexpr int32_t MIN_INT = std::numeric_limits<int32_t>::min();
    static constexpr int32_t MAX_INT = std::numeric_limits<int32_t>::max();
    static constexpr double RANGE = static_cast<double>(MAX_INT) - static_cast<double>(MIN_INT);

    int32_t value = MIN_INT;

    constexpr Weight() noexcept = default;
    constexpr explicit Weight(int32_t v) noexcept : value(v) {}

    static const Weight MaxValue;
    static const Weight MinValue;

    // Weight at the given fraction of the range, fraction clamped to [0, 1]
    static Weight from_fraction(double fraction) noexcept;

    double fraction() const noexcept {
        return (static_cast<double>(value) - static_cast<double>(MIN_INT)) / RANGE;
    }

    constexpr bool operator==(const Weight&) const noexcept = default;
    constexpr auto operator<=>(const Weight&) const noexcept = default;
};

inline constexpr Weight Weight::MaxValue{Weight::MAX_INT};
inline constexpr Weight Weight::MinValue{Weight::MIN_INT};

inline std::ostream& operator<<(std::ostream& os, Weight w) {
    return os << "Weight(" << w.value << ")";
}

} // namespace otree
