#pragma once

#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring> // For std::memcpy
#include <limits>
#include <span>

#include "error.hpp"

#if defined(__SIZEOF_INT128__)
    #define PINE_HAS_INT128 1
#endif

namespace pine {

#if defined(PINE_HAS_INT128)
__extension__ typedef __int128 int128;
__extension__ typedef unsigned __int128 uint128;
#endif

static_assert(sizeof(std::size_t) == sizeof(std::uintptr_t),
              "pine: the varint word must match the platform pointer width");

namespace detail {

constexpr unsigned WORD_BITS = std::numeric_limits<std::size_t>::digits;

/// Longest varint for one platform word: 5 bytes on 32-bit targets, 10 on 64-bit.
constexpr std::size_t MAX_VARINT_LEN = (WORD_BITS + 6) / 7;

using VarintBuffer = std::array<std::byte, MAX_VARINT_LEN>;

constexpr std::size_t encode_zigzag(std::ptrdiff_t v) noexcept {
    return (static_cast<std::size_t>(v) << 1) ^ static_cast<std::size_t>(v >> (WORD_BITS - 1));
}

constexpr std::ptrdiff_t decode_zigzag(std::size_t v) noexcept {
    return static_cast<std::ptrdiff_t>((v >> 1) ^ (~(v & 1) + 1));
}

// --- Varint Functions ---

constexpr std::size_t size_varint(std::size_t v) noexcept {
    std::size_t i = 1;
    while (v >= 0x80) {
        v >>= 7;
        i++;
    }
    return i;
}

/**
 * @brief Writes the minimal varint encoding of `v` into `buf`.
 * @return The number of bytes used, between 1 and MAX_VARINT_LEN.
 */
inline std::size_t encode_varint(std::size_t v, VarintBuffer& buf) noexcept {
    std::size_t i = 0;
    while (v >= 0x80) {
        buf[i++] = static_cast<std::byte>(v) | std::byte{0x80};
        v >>= 7;
    }
    buf[i++] = static_cast<std::byte>(v);
    return i;
}

/**
 * @brief Decodes a varint starting at offset `n` of `b`.
 *
 * Fails with Error::UnexpectedEnd when `b` ends before a byte with a clear
 * continuation flag, and with Error::VarintOverflow when the groups carry
 * more bits than a std::size_t holds.
 */
inline TakeResult<std::size_t> decode_varint(std::span<const std::byte> b, std::size_t n) noexcept {
    std::size_t x = 0;
    unsigned s = 0;
    for (std::size_t i = 0; i < MAX_VARINT_LEN; ++i) {
        if (n + i >= b.size()) {
            return Error::UnexpectedEnd;
        }
        const std::uint8_t B = std::to_integer<std::uint8_t>(b[n + i]);
        const std::size_t group = B & 0x7f;
        if (i == MAX_VARINT_LEN - 1) {
            // The last group may only fill the bits the word has left.
            if (B >= 0x80 || (group >> (WORD_BITS - s)) != 0) {
                return Error::VarintOverflow;
            }
        }
        x |= group << s;
        if (B < 0x80) {
            return UnmarshalResult<std::size_t>{x, n + i + 1};
        }
        s += 7;
    }
    return Error::VarintOverflow;
}

// --- Fixed-size Primitives (Little-Endian) ---

template<typename U>
inline void store_little_endian(std::byte* out, U v) noexcept {
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        out[i] = static_cast<std::byte>(static_cast<unsigned char>(v >> (i * CHAR_BIT)));
    }
}

template<typename U>
inline U load_little_endian(const std::byte* in) noexcept {
    U v = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        v |= static_cast<U>(static_cast<U>(std::to_integer<unsigned char>(in[i])) << (i * CHAR_BIT));
    }
    return v;
}

inline std::uint32_t float_bits(float f) noexcept {
    static_assert(sizeof(float) == sizeof(std::uint32_t));
    std::uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    return bits;
}

inline std::uint64_t float_bits(double f) noexcept {
    static_assert(sizeof(double) == sizeof(std::uint64_t));
    std::uint64_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    return bits;
}

template<typename F, typename U>
inline F float_from_bits(U bits) noexcept {
    static_assert(sizeof(F) == sizeof(U));
    F f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

} // namespace detail

// --- Public Varint API ---

inline std::size_t size_varint(std::size_t v) noexcept { return detail::size_varint(v); }
inline TakeResult<std::size_t> decode_varint(std::span<const std::byte> b, std::size_t n) noexcept { return detail::decode_varint(b, n); }

} // namespace pine
