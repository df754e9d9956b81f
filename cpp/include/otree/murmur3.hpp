#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace otree {

/**
 * Murmur3 x86_32 with the exact bit behaviour of Spark's Murmur3_x86_32.
 *
 * Used for:
 * 1. Row weights: chained hash over the raw indexed values (seed 42)
 * 2. Hashing transformations: value -> uniform coordinate
 *
 * The byte-wise tail of hash_bytes matches Spark's hashUnsafeBytes (each
 * trailing byte is mixed as a sign-extended int), not the reference
 * MurmurHash3 tail. Two writers must agree on this to share a table.
 */
class Murmur3 {
public:
    static constexpr int32_t DEFAULT_SEED = 42;

    static int32_t hash_int(int32_t input, int32_t seed) noexcept;
    static int32_t hash_long(int64_t input, int32_t seed) noexcept;
    static int32_t hash_bytes(std::span<const uint8_t> data, int32_t seed) noexcept;
    static int32_t hash_string(std::string_view str, int32_t seed) noexcept;

    // Java Double.doubleToLongBits / Float.floatToIntBits (canonical NaN)
    static int64_t double_to_long_bits(double value) noexcept;
    static int32_t float_to_int_bits(float value) noexcept;
};

} // namespace otree
