// Output sinks and the bounded-buffer entry point.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <pine/pine.hpp>

#include "harness.hpp"

//-///////////////////////////////////////////////////////////////////////////
// Test Types
//-///////////////////////////////////////////////////////////////////////////

struct Example {
    std::string foo;
    std::optional<std::uint32_t> bar;
    bool zot = false;

    auto fields() const { return std::tie(foo, bar, zot); }
    auto fields() { return std::tie(foo, bar, zot); }
};

//-///////////////////////////////////////////////////////////////////////////
// Test Cases
//-///////////////////////////////////////////////////////////////////////////

void test_bounded_sink() {
    std::array<std::byte, 4> storage{};
    pine::BoundedSink sink(storage);
    ASSERT(sink.capacity() == 4);
    ASSERT(sink.size() == 0);

    ASSERT(sink.try_push(std::byte{0xAA}) == pine::Error::Ok);
    const auto three = bytes_of({1, 2, 3});
    ASSERT(sink.try_extend(three) == pine::Error::Ok);
    ASSERT(sink.size() == 4);

    // Full: nothing more is written and earlier bytes stay intact.
    ASSERT(sink.try_push(std::byte{0xBB}) == pine::Error::BufferFull);
    ASSERT(sink.try_extend(bytes_of({9})) == pine::Error::BufferFull);
    ASSERT(sink.try_extend(std::span<const std::byte>{}) == pine::Error::Ok);
    ASSERT(same_bytes(sink.release(), bytes_of({0xAA, 1, 2, 3})));
}

void test_bounded_sink_rejects_oversized_chunk() {
    std::array<std::byte, 6> storage{};
    storage.fill(std::byte{0xEE});
    pine::BoundedSink sink(std::span<std::byte>(storage).first(4));

    ASSERT(sink.try_extend(bytes_of({1, 2})) == pine::Error::Ok);
    ASSERT(sink.try_extend(bytes_of({3, 4, 5})) == pine::Error::BufferFull);
    ASSERT(sink.size() == 2);

    // Nothing of the rejected chunk lands, inside or beyond the capacity.
    ASSERT(storage[2] == std::byte{0xEE});
    ASSERT(storage[4] == std::byte{0xEE});
    ASSERT(storage[5] == std::byte{0xEE});
    ASSERT(same_bytes(sink.release(), bytes_of({1, 2})));
}

void test_growable_sink() {
    pine::GrowableSink sink;
    sink.reserve(16);
    ASSERT(sink.size() == 0);
    for (int i = 0; i < 1000; ++i) {
        ASSERT(sink.try_push(static_cast<std::byte>(i)) == pine::Error::Ok);
    }
    std::vector<std::byte> chunk(5000, std::byte{7});
    ASSERT(sink.try_extend(chunk) == pine::Error::Ok);
    ASSERT(sink.size() == 6000);
    ASSERT(sink.data().size() == 6000);
    ASSERT(sink.data()[0] == std::byte{0});

    auto out = sink.release();
    ASSERT(out.size() == 6000);
    ASSERT(out[999] == static_cast<std::byte>(999 & 0xFF));
    ASSERT(out[5999] == std::byte{7});
}

void test_size_sink() {
    pine::SizeSink sink;
    ASSERT(sink.try_push(std::byte{1}) == pine::Error::Ok);
    ASSERT(sink.try_extend(bytes_of({1, 2, 3})) == pine::Error::Ok);
    ASSERT(sink.size() == 4);

    const Example value{"hi", 0x1337, true};
    auto size_res = pine::marshalled_size(value);
    auto vec_res = pine::marshal(value);
    ASSERT(std::get<std::size_t>(size_res) == std::get<std::vector<std::byte>>(vec_res).size());
}

void test_bounded_exhaustion() {
    const Example value{"hello bounded sink", 0xFFFFFFFF, true};
    const std::size_t k = std::get<std::size_t>(pine::marshalled_size(value));
    const auto expected = std::get<std::vector<std::byte>>(pine::marshal(value));
    ASSERT(k == expected.size());

    // Every capacity below K fails.
    for (std::size_t cap = 0; cap < k; ++cap) {
        std::vector<std::byte> buf(cap);
        ASSERT_ERR(pine::marshal_into(value, buf), pine::Error::BufferFull);
    }

    // Capacity K and above succeed using exactly K bytes.
    for (std::size_t cap = k; cap < k + 8; ++cap) {
        std::vector<std::byte> buf(cap, std::byte{0xEE});
        auto res = pine::marshal_into(value, buf);
        ASSERT(std::holds_alternative<std::span<std::byte>>(res));
        auto used = std::get<std::span<std::byte>>(res);
        ASSERT(used.size() == k);
        ASSERT(used.data() == buf.data());
        ASSERT(same_bytes(used, expected));
        if (cap > k) {
            ASSERT(buf[k] == std::byte{0xEE});
        }
    }
}

void test_marshal_into_matches_owned() {
    std::array<std::byte, 32> buf{};
    auto res = pine::marshal_into(std::string_view("Hi!"), buf);
    ASSERT(same_bytes(std::get<std::span<std::byte>>(res), bytes_of({0x03, 'H', 'i', '!'})));

    auto used = pine::marshal_into(true, buf);
    ASSERT(same_bytes(std::get<std::span<std::byte>>(used), bytes_of({0x01})));
}

//-///////////////////////////////////////////////////////////////////////////
// Main Test Runner
//-///////////////////////////////////////////////////////////////////////////

int main() {
    RUN_TEST(test_bounded_sink);
    RUN_TEST(test_bounded_sink_rejects_oversized_chunk);
    RUN_TEST(test_growable_sink);
    RUN_TEST(test_size_sink);
    RUN_TEST(test_bounded_exhaustion);
    RUN_TEST(test_marshal_into_matches_owned);
    return report_tests();
}
