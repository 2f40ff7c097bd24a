#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "deserializer.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "output.hpp"
#include "serializer.hpp"

namespace pine {

// --- Platform-word integers ---

/// An unsigned platform-word integer, encoded as a varint.
struct VarintUsize {
    std::size_t value;
    friend bool operator==(const VarintUsize&, const VarintUsize&) = default;
};

/// A signed platform-word integer, ZigZag-mapped and encoded as a varint.
struct VarintIsize {
    std::ptrdiff_t value;
    friend bool operator==(const VarintIsize&, const VarintIsize&) = default;
};

// --- Leaves ---

#define PINE_DEFINE_LEAF_SERDE(CppType, Name) \
    template<> \
    struct Serde<CppType> { \
        template<OutputSink S> \
        static Error serialize(Serializer<S>& s, CppType v) noexcept { return s.serialize_##Name(v); } \
        static Result<CppType> deserialize(Deserializer& d) noexcept { return d.deserialize_##Name(); } \
    };

PINE_DEFINE_LEAF_SERDE(bool,          bool)
PINE_DEFINE_LEAF_SERDE(std::uint8_t,  u8)
PINE_DEFINE_LEAF_SERDE(std::uint16_t, u16)
PINE_DEFINE_LEAF_SERDE(std::uint32_t, u32)
PINE_DEFINE_LEAF_SERDE(std::uint64_t, u64)
PINE_DEFINE_LEAF_SERDE(std::int8_t,   i8)
PINE_DEFINE_LEAF_SERDE(std::int16_t,  i16)
PINE_DEFINE_LEAF_SERDE(std::int32_t,  i32)
PINE_DEFINE_LEAF_SERDE(std::int64_t,  i64)
#if defined(PINE_HAS_INT128)
PINE_DEFINE_LEAF_SERDE(uint128,       u128)
PINE_DEFINE_LEAF_SERDE(int128,        i128)
#endif
PINE_DEFINE_LEAF_SERDE(float,         f32)
PINE_DEFINE_LEAF_SERDE(double,        f64)
PINE_DEFINE_LEAF_SERDE(char32_t,      char)

#undef PINE_DEFINE_LEAF_SERDE

template<>
struct Serde<std::byte> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, std::byte v) noexcept { return s.serialize_u8(std::to_integer<std::uint8_t>(v)); }

    static Result<std::byte> deserialize(Deserializer& d) noexcept {
        auto res = d.deserialize_u8();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return static_cast<std::byte>(std::get<std::uint8_t>(res));
    }
};

template<>
struct Serde<VarintUsize> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, VarintUsize v) noexcept { return s.serialize_varint(v.value); }

    static Result<VarintUsize> deserialize(Deserializer& d) noexcept {
        auto res = d.deserialize_varint();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return VarintUsize{std::get<std::size_t>(res)};
    }
};

template<>
struct Serde<VarintIsize> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, VarintIsize v) noexcept { return s.serialize_varint_signed(v.value); }

    static Result<VarintIsize> deserialize(Deserializer& d) noexcept {
        auto res = d.deserialize_varint_signed();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return VarintIsize{std::get<std::ptrdiff_t>(res)};
    }
};

template<>
struct Serde<std::monostate> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, std::monostate) noexcept { return s.serialize_unit(); }
    static Result<std::monostate> deserialize(Deserializer& d) noexcept { return d.deserialize_unit(); }
};

// --- Strings and bytes ---

template<>
struct Serde<std::string_view> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, std::string_view v) noexcept { return s.serialize_str(v); }

    /// Borrows from the input buffer.
    static Result<std::string_view> deserialize(Deserializer& d) noexcept { return d.deserialize_str(); }
};

template<>
struct Serde<std::string> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::string& v) noexcept { return s.serialize_str(v); }

    static Result<std::string> deserialize(Deserializer& d) {
        auto res = d.deserialize_str();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return std::string(std::get<std::string_view>(res));
    }
};

template<>
struct Serde<std::span<const std::byte>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, std::span<const std::byte> v) noexcept { return s.serialize_bytes(v); }

    /// Borrows from the input buffer.
    static Result<std::span<const std::byte>> deserialize(Deserializer& d) noexcept { return d.deserialize_bytes(); }
};

template<>
struct Serde<std::vector<std::byte>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::vector<std::byte>& v) noexcept { return s.serialize_bytes(v); }

    static Result<std::vector<std::byte>> deserialize(Deserializer& d) {
        auto res = d.deserialize_bytes();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        auto bytes = std::get<std::span<const std::byte>>(res);
        return std::vector<std::byte>(bytes.begin(), bytes.end());
    }
};

// --- Sequences ---

namespace detail {

/// Bytes a decoded sequence pre-allocates before its elements are read.
constexpr std::size_t RESERVE_BUDGET = std::size_t{1} << 20;

} // namespace detail

template<typename T>
struct Serde<std::vector<T>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::vector<T>& v) {
        PINE_TRY(s.serialize_seq_len(v.size()));
        for (const auto& t : v) {
            PINE_TRY(s.serialize(t));
        }
        return Error::Ok;
    }

    static Result<std::vector<T>> deserialize(Deserializer& d) {
        auto len_res = d.deserialize_seq_len();
        if (auto* err = std::get_if<Error>(&len_res)) return *err;
        const std::size_t len = std::get<std::size_t>(len_res);

        std::vector<T> ts;
        // An untrusted length must not drive the allocation by itself.
        ts.reserve(std::min({len, d.remaining(), std::max<std::size_t>(1, detail::RESERVE_BUDGET / sizeof(T))}));
        for (std::size_t i = 0; i < len; ++i) {
            auto item_res = d.deserialize<T>();
            if (auto* err = std::get_if<Error>(&item_res)) return *err;
            ts.push_back(std::move(std::get<0>(item_res)));
        }
        return ts;
    }
};

/// Fixed-size arrays are tuples: no length prefix.
template<typename T, std::size_t N>
struct Serde<std::array<T, N>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::array<T, N>& v) {
        for (const auto& t : v) {
            PINE_TRY(s.serialize(t));
        }
        return Error::Ok;
    }

    static Result<std::array<T, N>> deserialize(Deserializer& d) {
        std::array<T, N> out{};
        for (auto& t : out) {
            PINE_TRY(d.deserialize_into(t));
        }
        return out;
    }
};

// --- Maps ---

namespace detail {

template<typename Map, typename S>
Error serialize_map(Serializer<S>& s, const Map& m) {
    PINE_TRY(s.serialize_map_len(m.size()));
    for (const auto& [key, val] : m) {
        PINE_TRY(s.serialize(key));
        PINE_TRY(s.serialize(val));
    }
    return Error::Ok;
}

template<typename Map>
Result<Map> deserialize_map(Deserializer& d) {
    using K = typename Map::key_type;
    using V = typename Map::mapped_type;

    auto len_res = d.deserialize_map_len();
    if (auto* err = std::get_if<Error>(&len_res)) return *err;
    const std::size_t len = std::get<std::size_t>(len_res);

    Map m;
    for (std::size_t i = 0; i < len; ++i) {
        auto key_res = d.deserialize<K>();
        if (auto* err = std::get_if<Error>(&key_res)) return *err;

        auto val_res = d.deserialize<V>();
        if (auto* err = std::get_if<Error>(&val_res)) return *err;

        m.insert_or_assign(std::move(std::get<0>(key_res)), std::move(std::get<0>(val_res)));
    }
    return m;
}

} // namespace detail

template<typename K, typename V, typename Compare, typename Alloc>
struct Serde<std::map<K, V, Compare, Alloc>> {
    using Map = std::map<K, V, Compare, Alloc>;

    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const Map& m) { return detail::serialize_map(s, m); }
    static Result<Map> deserialize(Deserializer& d) { return detail::deserialize_map<Map>(d); }
};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct Serde<std::unordered_map<K, V, Hash, Eq, Alloc>> {
    using Map = std::unordered_map<K, V, Hash, Eq, Alloc>;

    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const Map& m) { return detail::serialize_map(s, m); }
    static Result<Map> deserialize(Deserializer& d) { return detail::deserialize_map<Map>(d); }
};

// --- Optionals ---

template<typename T>
struct Serde<std::optional<T>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::optional<T>& opt) {
        if (!opt.has_value()) {
            return s.serialize_none();
        }
        return s.serialize_some(*opt);
    }

    static Result<std::optional<T>> deserialize(Deserializer& d) {
        auto tag_res = d.deserialize_option_tag();
        if (auto* err = std::get_if<Error>(&tag_res)) return *err;
        if (!std::get<bool>(tag_res)) {
            return std::optional<T>{};
        }

        auto item_res = d.deserialize<T>();
        if (auto* err = std::get_if<Error>(&item_res)) return *err;
        return std::optional<T>{std::move(std::get<0>(item_res))};
    }
};

// --- Tuples ---

template<typename... Ts>
struct Serde<std::tuple<Ts...>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::tuple<Ts...>& t) {
        return std::apply([&s](const auto&... fields) { return s.serialize_fields(fields...); }, t);
    }

    static Result<std::tuple<Ts...>> deserialize(Deserializer& d) {
        std::tuple<Ts...> t;
        PINE_TRY(std::apply([&d](auto&... fields) { return d.deserialize_fields(fields...); }, t));
        return t;
    }
};

template<typename A, typename B>
struct Serde<std::pair<A, B>> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const std::pair<A, B>& p) { return s.serialize_fields(p.first, p.second); }

    static Result<std::pair<A, B>> deserialize(Deserializer& d) {
        std::pair<A, B> p;
        PINE_TRY(d.deserialize_fields(p.first, p.second));
        return p;
    }
};

// --- Enumerated variants ---

/**
 * @brief std::variant as a data-carrying enum.
 *
 * The alternative index is the discriminant. An index past the last
 * alternative fails with Error::InvalidEnumDiscriminant. A variant left
 * valueless by an exception is not encodable and fails with Error::Custom.
 */
template<typename... Ts>
struct Serde<std::variant<Ts...>> {
    using Variant = std::variant<Ts...>;

    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const Variant& v) {
        if (v.valueless_by_exception()) return Error::Custom;
        PINE_TRY(s.serialize_variant_index(static_cast<std::uint32_t>(v.index())));
        return std::visit([&s](const auto& alt) { return s.serialize(alt); }, v);
    }

    static Result<Variant> deserialize(Deserializer& d) {
        auto index_res = d.deserialize_variant_index();
        if (auto* err = std::get_if<Error>(&index_res)) return *err;
        const std::uint32_t index = std::get<std::uint32_t>(index_res);
        if (index >= sizeof...(Ts)) return Error::InvalidEnumDiscriminant;
        return deserialize_alternative(d, index, std::index_sequence_for<Ts...>{});
    }

private:
    template<std::size_t I>
    static Result<Variant> deserialize_at(Deserializer& d) {
        using Alt = std::variant_alternative_t<I, Variant>;
        auto res = d.deserialize<Alt>();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        return Variant(std::in_place_index<I>, std::move(std::get<0>(res)));
    }

    template<std::size_t... Is>
    static Result<Variant> deserialize_alternative(Deserializer& d, std::uint32_t index, std::index_sequence<Is...>) {
        using Fn = Result<Variant> (*)(Deserializer&);
        static constexpr Fn table[] = {&deserialize_at<Is>...};
        return table[index](d);
    }
};

/// A C++ enum whose enumerators are 0..count-1, encoded as unit variants.
template<typename E>
concept DeclaredEnum = std::is_enum_v<E> && requires {
    { EnumVariants<E>::count } -> std::convertible_to<std::uint32_t>;
};

template<DeclaredEnum E>
struct Serde<E> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, E v) noexcept {
        return s.serialize_variant_index(static_cast<std::uint32_t>(v));
    }

    static Result<E> deserialize(Deserializer& d) noexcept {
        auto res = d.deserialize_variant_index();
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const std::uint32_t index = std::get<std::uint32_t>(res);
        if (index >= EnumVariants<E>::count) return Error::InvalidEnumDiscriminant;
        return static_cast<E>(index);
    }
};

// --- Structs ---

/**
 * @brief A struct that lists its fields through `fields()`.
 *
 *     struct Point {
 *         std::int32_t x, y;
 *         auto fields() const { return std::tie(x, y); }
 *         auto fields() { return std::tie(x, y); }
 *     };
 *
 * Fields are written in the order `fields()` returns them, with no count
 * and no names. Decoding default-constructs the struct first.
 */
template<typename T>
concept Reflected = std::is_class_v<T> && requires(T& t, const T& ct) {
    t.fields();
    ct.fields();
};

template<Reflected T>
struct Serde<T> {
    template<OutputSink S>
    static Error serialize(Serializer<S>& s, const T& v) {
        return std::apply([&s](const auto&... fields) { return s.serialize_fields(fields...); }, v.fields());
    }

    static Result<T> deserialize(Deserializer& d) {
        T v{};
        PINE_TRY(std::apply([&d](auto&... fields) { return d.deserialize_fields(fields...); }, v.fields()));
        return v;
    }
};

} // namespace pine
