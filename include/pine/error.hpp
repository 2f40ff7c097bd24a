#pragma once

// --- Compiler/Language Standard Check ---
#if __cplusplus < 202002L
    #error "pine requires a C++20 compliant compiler. Please use the -std=c++20 flag."
#endif

#include <cstddef>
#include <string_view>
#include <variant>

namespace pine {

// --- Public Error and Result Types ---

/**
 * @brief Error codes for pine operations.
 *
 * Every failure is reported through one of these values; nothing is thrown.
 */
enum class Error {
    Ok = 0,                  ///< No error
    UnexpectedEnd,           ///< The input ended before a leaf or length could be read
    VarintOverflow,          ///< A varint does not fit the platform word
    InvalidBool,             ///< A bool byte was neither 0 nor 1
    InvalidOption,           ///< An option tag was neither 0 nor 1
    InvalidChar,             ///< A 32-bit value is not a Unicode scalar value
    InvalidUtf8,             ///< String bytes failed UTF-8 validation
    InvalidEnumDiscriminant, ///< A discriminant exceeds the modeled maximum or the declared variants
    BufferFull,              ///< The bounded output buffer is exhausted
    TrailingBytes,           ///< A top-level decode left unconsumed input
    Custom,                  ///< Raised by a Serde implementation, opaque to the codec
};

constexpr std::string_view error_name(Error e) noexcept {
    switch (e) {
        case Error::Ok:                      return "Ok";
        case Error::UnexpectedEnd:           return "UnexpectedEnd";
        case Error::VarintOverflow:          return "VarintOverflow";
        case Error::InvalidBool:             return "InvalidBool";
        case Error::InvalidOption:           return "InvalidOption";
        case Error::InvalidChar:             return "InvalidChar";
        case Error::InvalidUtf8:             return "InvalidUtf8";
        case Error::InvalidEnumDiscriminant: return "InvalidEnumDiscriminant";
        case Error::BufferFull:              return "BufferFull";
        case Error::TrailingBytes:           return "TrailingBytes";
        case Error::Custom:                  return "Custom";
    }
    return "Unknown";
}

/**
 * @brief A value or the error that prevented producing it.
 * @tparam T The type of the value on success.
 */
template<typename T>
using Result = std::variant<T, Error>;

/**
 * @brief A decoded value together with the offset just past its encoding.
 * @tparam T The type of the decoded value.
 */
template<typename T>
struct UnmarshalResult {
    T value;
    std::size_t new_offset;
};

/**
 * @brief A variant representing either an UnmarshalResult or an error.
 */
template<typename T>
using TakeResult = std::variant<UnmarshalResult<T>, Error>;

} // namespace pine

/// Returns the error of `expr` from the enclosing function unless it is Error::Ok.
#define PINE_TRY(expr) \
    do { \
        if (::pine::Error pine_try_err_ = (expr); pine_try_err_ != ::pine::Error::Ok) { \
            return pine_try_err_; \
        } \
    } while (0)
