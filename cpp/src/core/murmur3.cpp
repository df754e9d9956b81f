#include "otree/murmur3.hpp"

#include <cmath>
#include <cstring>

// Spark-compatible Murmur3 x86_32. All arithmetic is done on uint32_t and
// reinterpreted as int32_t at the boundary to mirror Java's wrapping ints.

namespace otree {

namespace {

constexpr uint32_t C1 = 0xcc9e2d51U;
constexpr uint32_t C2 = 0x1b873593U;

inline uint32_t rotl32(uint32_t x, int r) {
    return (x << r) | (x >> (32 - r));
}

inline uint32_t mix_k1(uint32_t k1) {
    k1 *= C1;
    k1 = rotl32(k1, 15);
    k1 *= C2;
    return k1;
}

inline uint32_t mix_h1(uint32_t h1, uint32_t k1) {
    h1 ^= k1;
    h1 = rotl32(h1, 13);
    h1 = h1 * 5U + 0xe6546b64U;
    return h1;
}

inline uint32_t fmix(uint32_t h1, uint32_t length) {
    h1 ^= length;
    h1 ^= h1 >> 16;
    h1 *= 0x85ebca6bU;
    h1 ^= h1 >> 13;
    h1 *= 0xc2b2ae35U;
    h1 ^= h1 >> 16;
    return h1;
}

inline int32_t as_signed(uint32_t v) {
    int32_t out;
    std::memcpy(&out, &v, sizeof(out));
    return out;
}

inline uint32_t as_unsigned(int32_t v) {
    uint32_t out;
    std::memcpy(&out, &v, sizeof(out));
    return out;
}

// Little-endian 32-bit load, independent of host byte order
inline uint32_t load_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

} // anonymous namespace

int32_t Murmur3::hash_int(int32_t input, int32_t seed) noexcept {
    uint32_t k1 = mix_k1(as_unsigned(input));
    uint32_t h1 = mix_h1(as_unsigned(seed), k1);
    return as_signed(fmix(h1, 4));
}

int32_t Murmur3::hash_long(int64_t input, int32_t seed) noexcept {
    uint64_t bits = static_cast<uint64_t>(input);
    uint32_t low = static_cast<uint32_t>(bits);
    uint32_t high = static_cast<uint32_t>(bits >> 32);

    uint32_t h1 = mix_h1(as_unsigned(seed), mix_k1(low));
    h1 = mix_h1(h1, mix_k1(high));
    return as_signed(fmix(h1, 8));
}

int32_t Murmur3::hash_bytes(std::span<const uint8_t> data, int32_t seed) noexcept {
    const size_t length = data.size();
    const size_t aligned = length - length % 4;

    uint32_t h1 = as_unsigned(seed);
    for (size_t i = 0; i < aligned; i += 4) {
        h1 = mix_h1(h1, mix_k1(load_le32(data.data() + i)));
    }
    for (size_t i = aligned; i < length; ++i) {
        // Java bytes are signed: sign-extend before mixing
        int32_t half_word = static_cast<int8_t>(data[i]);
        h1 = mix_h1(h1, mix_k1(as_unsigned(half_word)));
    }
    return as_signed(fmix(h1, static_cast<uint32_t>(length)));
}

int32_t Murmur3::hash_string(std::string_view str, int32_t seed) noexcept {
    return hash_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()), seed);
}

int64_t Murmur3::double_to_long_bits(double value) noexcept {
    if (std::isnan(value)) {
        return 0x7ff8000000000000LL;
    }
    if (value == 0.0) {
        value = 0.0;  // -0.0 and 0.0 hash alike
    }
    int64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

int32_t Murmur3::float_to_int_bits(float value) noexcept {
    if (std::isnan(value)) {
        return 0x7fc00000;
    }
    if (value == 0.0f) {
        value = 0.0f;
    }
    int32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

} // namespace otree
