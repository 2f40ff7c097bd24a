#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include "deserializer.hpp"
#include "error.hpp"
#include "output.hpp"
#include "serde.hpp"
#include "serializer.hpp"
#include "varint.hpp"

namespace pine {

// --- Encoding ---

/**
 * @brief Encodes `value` into the caller's buffer without allocating.
 * @return The used prefix of `buf`, or Error::BufferFull if it is too small.
 *         After a failure the contents of `buf` are unspecified.
 */
template<typename T>
Result<std::span<std::byte>> marshal_into(const T& value, std::span<std::byte> buf) {
    BoundedSink sink(buf);
    Serializer<BoundedSink> serializer(sink);
    PINE_TRY(serializer.serialize(value));
    return sink.release();
}

/**
 * @brief Encodes `value` into a newly allocated buffer.
 */
template<typename T>
Result<std::vector<std::byte>> marshal(const T& value) {
    GrowableSink sink;
    Serializer<GrowableSink> serializer(sink);
    PINE_TRY(serializer.serialize(value));
    return sink.release();
}

/**
 * @brief The exact number of bytes marshal() would produce for `value`.
 */
template<typename T>
Result<std::size_t> marshalled_size(const T& value) {
    SizeSink sink;
    Serializer<SizeSink> serializer(sink);
    PINE_TRY(serializer.serialize(value));
    return sink.size();
}

// --- Decoding ---
//
// Decoding trusts the caller: `b` is read as an encoding of T whatever it
// was produced from. A mismatched T is not detected; it yields either a
// meaningless value or one of the errors listed on Deserializer. These
// functions are not a validation step.

/**
 * @brief Decodes a T from the start of `b` and reports where it ended.
 *
 * Bytes after the value are left alone; `new_offset` is the index of the
 * first one.
 */
template<typename T>
TakeResult<T> take_unmarshal_trusted(std::span<const std::byte> b) {
    Deserializer deserializer(b);
    auto res = deserializer.deserialize<T>();
    if (auto* err = std::get_if<Error>(&res)) return *err;
    return UnmarshalResult<T>{std::move(std::get<0>(res)), deserializer.offset()};
}

/**
 * @brief Decodes a T that must occupy all of `b`.
 *
 * Fails with Error::TrailingBytes when the value ends before the buffer.
 */
template<typename T>
Result<T> unmarshal_trusted(std::span<const std::byte> b) {
    Deserializer deserializer(b);
    auto res = deserializer.deserialize<T>();
    if (std::holds_alternative<Error>(res)) return res;
    if (deserializer.has_remaining()) return Error::TrailingBytes;
    return res;
}

} // namespace pine
