#include <gtest/gtest.h>
#include "../../codec/codec.hpp"
#include "../../derive/derive.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <new>
#include <variant>
#include <vector>

using codec::buffer_t;

namespace {

/// Remembers the largest single allocation of all the instances.
template <typename T>
struct counting_allocator {
    using value_type = T;

    counting_allocator() = default;

    template <typename U>
    counting_allocator(const counting_allocator<U>&) noexcept {
    }

    T* allocate(std::size_t n) {
        largest = std::max(largest, n * sizeof(T));
        return std::allocator<T>().allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        std::allocator<T>().deallocate(p, n);
    }

    bool operator==(const counting_allocator&) const noexcept {
        return true;
    }

    inline static std::size_t largest = 0;
};

/// Refuses every allocation above one kilobyte.
template <typename T>
struct refusing_allocator {
    using value_type = T;

    refusing_allocator() = default;

    template <typename U>
    refusing_allocator(const refusing_allocator<U>&) noexcept {
    }

    T* allocate(std::size_t n) {
        if (n * sizeof(T) > 1024) {
            throw std::bad_alloc();
        }
        return std::allocator<T>().allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        std::allocator<T>().deallocate(p, n);
    }

    bool operator==(const refusing_allocator&) const noexcept {
        return true;
    }
};

buffer_t length_field(uint64_t length) {
    return codec::to_bytes(length);
}

}

struct empty_record
{
};

AP_RECORD(empty_record)

TEST(DecodeBudgetTest, claim_release_consume) {
    codec::decode_budget budget(100, 1000);
    budget.claim(10, 8);
    EXPECT_EQ(20u, budget.remaining());
    budget.release(8);
    budget.consume(8);
    EXPECT_EQ(20u, budget.remaining());
    EXPECT_THROW(budget.claim(3, 8), codec::oversized_request);
    EXPECT_THROW(budget.consume(21), codec::oversized_request);
    EXPECT_EQ(20u, budget.remaining());
}

TEST(DecodeBudgetTest, overflowing_claim_is_rejected) {
    codec::decode_budget budget(std::numeric_limits<uint64_t>::max(), 1000);
    EXPECT_THROW(budget.claim(std::numeric_limits<uint64_t>::max() / 2, 4), codec::oversized_request);
}

TEST(DecodeBudgetTest, zero_sized_elements_use_element_limit) {
    codec::decode_budget budget(0, 1000);
    budget.claim(600, 0);
    EXPECT_EQ(400u, budget.element_allowance());
    EXPECT_THROW(budget.claim(401, 0), codec::oversized_request);
    budget.claim(400, 0);
    EXPECT_THROW(budget.claim(1, 0), codec::oversized_request);
}

TEST(DecodeBudgetTest, empty_elements_are_bounded_by_input_size) {
    using empties_t = std::vector<std::monostate>;
    EXPECT_EQ(3u, codec::from_bytes<empties_t>(codec::to_bytes(empties_t(3))).size());
    EXPECT_THROW(codec::from_bytes<empties_t>(length_field(2'000'000)), codec::oversized_request);
}

TEST(DecodeBudgetTest, nested_empty_elements_share_one_allowance) {
    using nested_t = std::vector<std::vector<empty_record>>;
    // 1000 inner lists, each claiming 100000 empty records.
    auto hostile = length_field(1000);
    for (int i = 0; i < 1000; ++i) {
        const auto inner = length_field(100'000);
        hostile.insert(hostile.end(), inner.begin(), inner.end());
    }
    EXPECT_THROW(codec::from_bytes<nested_t>(hostile), codec::oversized_request);

    // Every inner list fits alone, all of them together exceed the 88 input bytes.
    auto spread = length_field(10);
    for (int i = 0; i < 10; ++i) {
        const auto inner = length_field(80);
        spread.insert(spread.end(), inner.begin(), inner.end());
    }
    EXPECT_THROW(codec::from_bytes<nested_t>(spread), codec::oversized_request);
}

TEST(DecodeBudgetTest, hostile_length_is_rejected_before_reading_elements) {
    auto bytes = length_field(uint64_t(1) << 40);
    bytes.insert(bytes.end(), {0, 0, 0, 0, 0, 0, 0, 1});
    try {
        codec::from_bytes<std::vector<uint64_t>>(bytes);
        FAIL() << "expected oversized_request";
    } catch (const codec::oversized_request& e) {
        EXPECT_EQ("8", e.param("remaining"));
    }
}

TEST(DecodeBudgetTest, length_beyond_available_bytes) {
    // Three 4-byte elements are claimed, only two follow.
    auto bytes = length_field(3);
    bytes.insert(bytes.end(), {0, 0, 0, 1, 0, 0, 0, 2});
    EXPECT_THROW(codec::from_bytes<std::vector<uint32_t>>(bytes), codec::oversized_request);

    auto text = length_field(9);
    text.insert(text.end(), {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'});
    EXPECT_THROW(codec::from_bytes<std::string>(text), codec::oversized_request);
}

TEST(DecodeBudgetTest, configured_limit_applies) {
    auto bytes = codec::to_bytes(std::vector<uint32_t>(100, 1));
    codec::options o;
    o.max_decode_bytes = 64;
    EXPECT_THROW(codec::from_bytes<std::vector<uint32_t>>(bytes, o), codec::oversized_request);
    o.max_decode_bytes = bytes.size();
    EXPECT_EQ(100u, codec::from_bytes<std::vector<uint32_t>>(bytes, o).size());
}

TEST(DecodeBudgetTest, preallocation_is_bounded_on_open_ended_source) {
    using vector_t = std::vector<uint64_t, counting_allocator<uint64_t>>;
    // 100M elements claimed, two present. The source doesn't know its size, so only the end of stream stops the decode.
    auto bytes = length_field(100'000'000);
    bytes.insert(bytes.end(), 16, 0x01);
    codec::options o;
    o.max_decode_bytes = uint64_t(1) << 40;
    o.preallocation_limit = 1024;

    counting_allocator<uint64_t>::largest = 0;
    stream::memory_source source(bytes, true);
    EXPECT_THROW(codec::decode_blocking<vector_t>(source, o), codec::unexpected_end_of_stream);
    EXPECT_LE(counting_allocator<uint64_t>::largest, 1024u);
}

TEST(DecodeBudgetTest, refused_allocation_is_recoverable) {
    using blob_t = std::vector<uint8_t, refusing_allocator<uint8_t>>;
    auto bytes = codec::to_bytes(std::vector<uint8_t>(4000, 0x2A));
    codec::options o;
    o.preallocation_limit = 512;
    EXPECT_THROW(codec::from_bytes<blob_t>(bytes, o), codec::allocation_failed);

    blob_t small(100, 0x2A);
    EXPECT_EQ(small, codec::from_bytes<blob_t>(codec::to_bytes(small), o));
}

TEST(DecodeBudgetTest, reads_are_charged) {
    auto bytes = codec::to_bytes(uint64_t(5));
    stream::memory_source source(bytes);
    codec::options o;
    codec::reader r(source, o);
    EXPECT_EQ(8u, r.budget().remaining());
    EXPECT_EQ(5u, async::run_blocking(codec::read<uint64_t>(r)));
    EXPECT_EQ(0u, r.budget().remaining());
    EXPECT_EQ(8u, r.position());
}
