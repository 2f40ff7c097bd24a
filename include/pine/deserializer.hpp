#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include "error.hpp"
#include "fwd.hpp"
#include "varint.hpp"

namespace pine {

namespace detail {

/// Elements a sequence or map may declare beyond the bytes left to read.
constexpr std::size_t MAX_EMPTY_ELEMENTS = std::size_t{1} << 16;

constexpr bool is_unicode_scalar(std::uint32_t cp) noexcept {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

/// Rejects truncated sequences, overlong forms, surrogates and code points above U+10FFFF.
inline bool is_valid_utf8(std::span<const std::byte> s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t c = std::to_integer<std::uint8_t>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        std::uint32_t cp;
        std::uint32_t min;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min = 0x10000;
        } else {
            return false;
        }
        if (s.size() - i < len) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const std::uint8_t cc = std::to_integer<std::uint8_t>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || !is_unicode_scalar(cp)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace detail

/**
 * @brief Reads one value back from an immutable byte span.
 *
 * The deserializer trusts the caller: it decodes whatever shape is
 * requested, byte for byte, without checking that the input was produced
 * from that shape. A mismatched request may succeed with a meaningless
 * value, consume a different number of bytes, or fail one of the checks
 * below. Reads never go past the end of the input.
 *
 * Recursive shapes recurse on the call stack, so nesting depth is bounded
 * only by the length of the input.
 *
 * Checks performed, and nothing else:
 *  - input exhausted                 -> Error::UnexpectedEnd
 *  - varint wider than the word      -> Error::VarintOverflow
 *  - bool byte other than 0 or 1     -> Error::InvalidBool
 *  - option tag other than 0 or 1    -> Error::InvalidOption
 *  - code point not a scalar value   -> Error::InvalidChar
 *  - string bytes not UTF-8          -> Error::InvalidUtf8
 *  - discriminant above UINT32_MAX   -> Error::InvalidEnumDiscriminant
 *  - element count beyond the input  -> Error::UnexpectedEnd
 *    (more than remaining() + MAX_EMPTY_ELEMENTS)
 */
class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> input) noexcept : input_(input) {}

    std::size_t offset() const noexcept { return offset_; }
    std::size_t remaining() const noexcept { return input_.size() - offset_; }
    bool has_remaining() const noexcept { return offset_ < input_.size(); }

    /// The unread tail of the input.
    std::span<const std::byte> rest() const noexcept { return input_.subspan(offset_); }

    // --- Leaves ---

    Result<bool> deserialize_bool() noexcept {
        auto res = deserialize_u8();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        switch (std::get<std::uint8_t>(res)) {
            case 0: return false;
            case 1: return true;
            default: return Error::InvalidBool;
        }
    }

    Result<std::uint8_t> deserialize_u8() noexcept {
        if (remaining() < 1) return Error::UnexpectedEnd;
        return std::to_integer<std::uint8_t>(input_[offset_++]);
    }

    Result<std::uint16_t> deserialize_u16() noexcept { return read_fixed<std::uint16_t>(); }
    Result<std::uint32_t> deserialize_u32() noexcept { return read_fixed<std::uint32_t>(); }
    Result<std::uint64_t> deserialize_u64() noexcept { return read_fixed<std::uint64_t>(); }

    Result<std::int8_t> deserialize_i8() noexcept { return read_signed<std::int8_t, std::uint8_t>(); }
    Result<std::int16_t> deserialize_i16() noexcept { return read_signed<std::int16_t, std::uint16_t>(); }
    Result<std::int32_t> deserialize_i32() noexcept { return read_signed<std::int32_t, std::uint32_t>(); }
    Result<std::int64_t> deserialize_i64() noexcept { return read_signed<std::int64_t, std::uint64_t>(); }

#if defined(PINE_HAS_INT128)
    Result<uint128> deserialize_u128() noexcept { return read_fixed<uint128>(); }
    Result<int128> deserialize_i128() noexcept { return read_signed<int128, uint128>(); }
#endif

    Result<float> deserialize_f32() noexcept {
        auto res = read_fixed<std::uint32_t>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return detail::float_from_bits<float>(std::get<std::uint32_t>(res));
    }

    Result<double> deserialize_f64() noexcept {
        auto res = read_fixed<std::uint64_t>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return detail::float_from_bits<double>(std::get<std::uint64_t>(res));
    }

    Result<char32_t> deserialize_char() noexcept {
        auto res = read_fixed<std::uint32_t>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const std::uint32_t cp = std::get<std::uint32_t>(res);
        if (!detail::is_unicode_scalar(cp)) return Error::InvalidChar;
        return static_cast<char32_t>(cp);
    }

    Result<std::size_t> deserialize_varint() noexcept {
        auto res = detail::decode_varint(input_, offset_);
        if (auto* err = std::get_if<Error>(&res)) return *err;
        auto& [value, new_offset] = std::get<UnmarshalResult<std::size_t>>(res);
        offset_ = new_offset;
        return value;
    }

    Result<std::ptrdiff_t> deserialize_varint_signed() noexcept {
        auto res = deserialize_varint();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return detail::decode_zigzag(std::get<std::size_t>(res));
    }

    /// A length-prefixed UTF-8 string, borrowed from the input.
    Result<std::string_view> deserialize_str() noexcept {
        auto res = deserialize_bytes();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        auto bytes = std::get<std::span<const std::byte>>(res);
        if (!detail::is_valid_utf8(bytes)) return Error::InvalidUtf8;
        return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    /// A length-prefixed byte run, borrowed from the input.
    Result<std::span<const std::byte>> deserialize_bytes() noexcept {
        auto len_res = deserialize_varint();
        if (auto* err = std::get_if<Error>(&len_res)) return *err;
        return take(std::get<std::size_t>(len_res));
    }

    Result<std::monostate> deserialize_unit() noexcept { return std::monostate{}; }

    // --- Composite framing ---

    /// The presence tag of an optional: false when absent.
    Result<bool> deserialize_option_tag() noexcept {
        auto res = deserialize_u8();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        switch (std::get<std::uint8_t>(res)) {
            case 0: return false;
            case 1: return true;
            default: return Error::InvalidOption;
        }
    }

    Result<std::size_t> deserialize_seq_len() noexcept { return read_count(); }
    Result<std::size_t> deserialize_map_len() noexcept { return read_count(); }

    /**
     * @brief The zero-based index of an enum variant.
     *
     * Only the modeled maximum (UINT32_MAX) is checked here; whether the
     * index names a declared variant is for the type's Serde to decide.
     */
    Result<std::uint32_t> deserialize_variant_index() noexcept {
        auto res = deserialize_varint();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const std::size_t index = std::get<std::size_t>(res);
        if (index > std::numeric_limits<std::uint32_t>::max()) return Error::InvalidEnumDiscriminant;
        return static_cast<std::uint32_t>(index);
    }

    /// Any value with a Serde binding.
    template<typename T>
    Result<T> deserialize() {
        return Serde<T>::deserialize(*this);
    }

    template<typename T>
    Error deserialize_into(T& out) {
        auto res = deserialize<T>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        out = std::move(std::get<0>(res));
        return Error::Ok;
    }

    /// Fields of a tuple or struct in declaration order.
    template<typename... Ts>
    Error deserialize_fields(Ts&... fields) {
        Error err = Error::Ok;
        static_cast<void>(((err = deserialize_into(fields), err == Error::Ok) && ...));
        return err;
    }

private:
    // Every element past the remaining bytes must encode to nothing; only a
    // bounded number of those is accepted.
    Result<std::size_t> read_count() noexcept {
        auto res = deserialize_varint();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const std::size_t len = std::get<std::size_t>(res);
        if (len > remaining() && len - remaining() > detail::MAX_EMPTY_ELEMENTS) return Error::UnexpectedEnd;
        return len;
    }

    Result<std::span<const std::byte>> take(std::size_t n) noexcept {
        if (remaining() < n) return Error::UnexpectedEnd;
        auto out = input_.subspan(offset_, n);
        offset_ += n;
        return out;
    }

    template<typename U>
    Result<U> read_fixed() noexcept {
        if (remaining() < sizeof(U)) return Error::UnexpectedEnd;
        const U v = detail::load_little_endian<U>(input_.data() + offset_);
        offset_ += sizeof(U);
        return v;
    }

    template<typename S, typename U>
    Result<S> read_signed() noexcept {
        auto res = read_fixed<U>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return static_cast<S>(std::get<U>(res));
    }

    std::span<const std::byte> input_;
    std::size_t offset_ = 0;
};

} // namespace pine
