#pragma once

#include <cstdint>

namespace pine {

/**
 * @brief Per-type binding between a C++ type and the wire format.
 *
 * A specialisation provides
 *
 *     template<OutputSink S> static Error serialize(Serializer<S>&, const T&);
 *     static Result<T> deserialize(Deserializer&);
 *
 * serde.hpp specialises it for the standard vocabulary types, for enums
 * with an EnumVariants declaration, and for types exposing `fields()`.
 */
template<typename T>
struct Serde;

/**
 * @brief Declares how many variants a C++ enum has.
 *
 * Specialise with `static constexpr std::uint32_t count = N;` for an enum
 * whose enumerators are 0..N-1 in declaration order.
 */
template<typename E>
struct EnumVariants {};

class Deserializer;

} // namespace pine
