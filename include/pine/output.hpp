#pragma once

#include <concepts>
#include <cstddef>
#include <cstring> // For std::memcpy
#include <span>
#include <utility>
#include <vector>

#include "error.hpp"
#include "varint.hpp"

namespace pine {

/**
 * @brief Requirements for a destination of serialized bytes.
 *
 * `try_push` appends one byte, `try_extend` appends a run of bytes. Both
 * return Error::Ok or the reason the bytes could not be stored.
 */
template<typename S>
concept OutputSink = requires(S& sink, std::byte b, std::span<const std::byte> bs) {
    { sink.try_push(b) } -> std::same_as<Error>;
    { sink.try_extend(bs) } -> std::same_as<Error>;
};

// --- Bounded Sink ---

/**
 * @brief Writes into a caller-owned buffer of fixed capacity.
 *
 * A write that does not fit fails with Error::BufferFull and stores none of
 * its bytes; bytes written before it are left in place. The buffer is
 * borrowed and must outlive the sink.
 */
class BoundedSink {
public:
    explicit BoundedSink(std::span<std::byte> buf) noexcept : buf_(buf) {}

    Error try_push(std::byte b) noexcept {
        if (idx_ >= buf_.size()) {
            return Error::BufferFull;
        }
        buf_[idx_++] = b;
        return Error::Ok;
    }

    Error try_extend(std::span<const std::byte> data) noexcept {
        if (data.size() > buf_.size() - idx_) {
            return Error::BufferFull;
        }
        if (!data.empty()) {
            std::memcpy(buf_.data() + idx_, data.data(), data.size());
        }
        idx_ += data.size();
        return Error::Ok;
    }

    std::size_t size() const noexcept { return idx_; }
    std::size_t capacity() const noexcept { return buf_.size(); }

    /// The written prefix of the caller's buffer.
    std::span<std::byte> release() const noexcept { return buf_.first(idx_); }

private:
    std::span<std::byte> buf_;
    std::size_t idx_ = 0;
};

// --- Growable Sink ---

/**
 * @brief Appends to an owned, geometrically growing buffer.
 *
 * Never reports a capacity error. Allocation failure is not recoverable:
 * the operations are noexcept, so std::bad_alloc terminates.
 */
class GrowableSink {
public:
    GrowableSink() = default;

    void reserve(std::size_t n) { buf_.reserve(n); }

    Error try_push(std::byte b) noexcept {
        buf_.push_back(b);
        return Error::Ok;
    }

    Error try_extend(std::span<const std::byte> data) noexcept {
        buf_.insert(buf_.end(), data.begin(), data.end());
        return Error::Ok;
    }

    std::size_t size() const noexcept { return buf_.size(); }
    const std::vector<std::byte>& data() const noexcept { return buf_; }

    std::vector<std::byte> release() noexcept { return std::move(buf_); }

private:
    std::vector<std::byte> buf_;
};

// --- Size Sink ---

/// Counts the bytes an encoding would take without storing them.
class SizeSink {
public:
    Error try_push(std::byte) noexcept {
        ++size_;
        return Error::Ok;
    }

    Error try_extend(std::span<const std::byte> data) noexcept {
        size_ += data.size();
        return Error::Ok;
    }

    std::size_t size() const noexcept { return size_; }

private:
    std::size_t size_ = 0;
};

static_assert(OutputSink<BoundedSink>);
static_assert(OutputSink<GrowableSink>);
static_assert(OutputSink<SizeSink>);

/**
 * @brief Writes the minimal varint encoding of `v` to `sink`.
 *
 * Fails only when the sink does.
 */
template<OutputSink Sink>
Error encode_varint(std::size_t v, Sink& sink) {
    detail::VarintBuffer buf;
    const std::size_t len = detail::encode_varint(v, buf);
    return sink.try_extend(std::span<const std::byte>(buf.data(), len));
}

} // namespace pine
