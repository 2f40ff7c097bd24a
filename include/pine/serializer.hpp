#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "error.hpp"
#include "fwd.hpp"
#include "output.hpp"
#include "varint.hpp"

namespace pine {

/**
 * @brief Emits the encoding of one value to a sink, depth first.
 *
 * Leaves are written as fixed-width little-endian bytes; lengths, counts,
 * discriminants and platform-word integers are varints. Composite values
 * are driven by their Serde<T> binding through serialize(). The serializer
 * adds no failure modes of its own: errors come from the sink or from a
 * Serde implementation.
 */
template<OutputSink Sink>
class Serializer {
public:
    explicit Serializer(Sink& output) noexcept : output_(output) {}

    Sink& output() noexcept { return output_; }

    // --- Leaves ---

    Error serialize_bool(bool v) noexcept {
        return output_.try_push(v ? std::byte{1} : std::byte{0});
    }

    Error serialize_u8(std::uint8_t v) noexcept { return output_.try_push(static_cast<std::byte>(v)); }
    Error serialize_u16(std::uint16_t v) noexcept { return write_fixed(v); }
    Error serialize_u32(std::uint32_t v) noexcept { return write_fixed(v); }
    Error serialize_u64(std::uint64_t v) noexcept { return write_fixed(v); }

    Error serialize_i8(std::int8_t v) noexcept { return serialize_u8(static_cast<std::uint8_t>(v)); }
    Error serialize_i16(std::int16_t v) noexcept { return write_fixed(static_cast<std::uint16_t>(v)); }
    Error serialize_i32(std::int32_t v) noexcept { return write_fixed(static_cast<std::uint32_t>(v)); }
    Error serialize_i64(std::int64_t v) noexcept { return write_fixed(static_cast<std::uint64_t>(v)); }

#if defined(PINE_HAS_INT128)
    Error serialize_u128(uint128 v) noexcept { return write_fixed(v); }
    Error serialize_i128(int128 v) noexcept { return write_fixed(static_cast<uint128>(v)); }
#endif

    Error serialize_f32(float v) noexcept { return write_fixed(detail::float_bits(v)); }
    Error serialize_f64(double v) noexcept { return write_fixed(detail::float_bits(v)); }

    /// A Unicode scalar value as its 32-bit code point.
    Error serialize_char(char32_t v) noexcept { return write_fixed(static_cast<std::uint32_t>(v)); }

    Error serialize_varint(std::size_t v) noexcept { return encode_varint(v, output_); }
    Error serialize_varint_signed(std::ptrdiff_t v) noexcept { return encode_varint(detail::encode_zigzag(v), output_); }

    Error serialize_str(std::string_view s) noexcept {
        PINE_TRY(serialize_varint(s.size()));
        return output_.try_extend(std::span<const std::byte>(reinterpret_cast<const std::byte*>(s.data()), s.size()));
    }

    Error serialize_bytes(std::span<const std::byte> bs) noexcept {
        PINE_TRY(serialize_varint(bs.size()));
        return output_.try_extend(bs);
    }

    Error serialize_unit() noexcept { return Error::Ok; }

    // --- Composite framing ---

    Error serialize_none() noexcept { return serialize_u8(0); }

    template<typename T>
    Error serialize_some(const T& value) {
        PINE_TRY(serialize_u8(1));
        return serialize(value);
    }

    Error serialize_seq_len(std::size_t len) noexcept { return serialize_varint(len); }
    Error serialize_map_len(std::size_t len) noexcept { return serialize_varint(len); }
    Error serialize_variant_index(std::uint32_t index) noexcept { return serialize_varint(index); }

    /// Any value with a Serde binding.
    template<typename T>
    Error serialize(const T& value) {
        return Serde<T>::serialize(*this, value);
    }

    /// Fields of a tuple or struct in declaration order, without a count.
    template<typename... Ts>
    Error serialize_fields(const Ts&... fields) {
        Error err = Error::Ok;
        static_cast<void>(((err = serialize(fields), err == Error::Ok) && ...));
        return err;
    }

    /// An enum variant: its zero-based index followed by its fields.
    template<typename... Ts>
    Error serialize_variant(std::uint32_t index, const Ts&... fields) {
        PINE_TRY(serialize_variant_index(index));
        return serialize_fields(fields...);
    }

private:
    template<typename U>
    Error write_fixed(U v) noexcept {
        std::byte buf[sizeof(U)];
        detail::store_little_endian(buf, v);
        return output_.try_extend(std::span<const std::byte>(buf, sizeof(U)));
    }

    Sink& output_;
};

} // namespace pine
