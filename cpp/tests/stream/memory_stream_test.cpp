#include <gtest/gtest.h>
#include "../../async/run.hpp"
#include "../../stream/exceptions.hpp"
#include "../../stream/memory_stream.hpp"

#include <array>
#include <vector>

TEST(MemoryStreamTest, reads_exactly) {
    std::vector<uint8_t> data{1, 2, 3, 4, 5};
    stream::memory_source source(data);
    EXPECT_EQ(5u, source.remaining());

    std::array<uint8_t, 3> head{};
    async::run_blocking(source.read_exact(head));
    EXPECT_EQ((std::array<uint8_t, 3>{1, 2, 3}), head);
    EXPECT_EQ(3u, source.position());
    EXPECT_EQ(2u, source.remaining());
}

TEST(MemoryStreamTest, short_read_is_end_of_stream) {
    std::vector<uint8_t> data{1, 2};
    stream::memory_source source(data);
    std::array<uint8_t, 4> buffer{};
    try {
        async::run_blocking(source.read_exact(buffer));
        FAIL() << "expected unexpected_end_of_stream";
    } catch (const stream::unexpected_end_of_stream& e) {
        EXPECT_EQ("4", e.param("requested"));
        EXPECT_EQ("2", e.param("received"));
    }
}

TEST(MemoryStreamTest, open_ended_source_has_unknown_size) {
    std::vector<uint8_t> data{1, 2};
    stream::memory_source source(data, true);
    EXPECT_FALSE(source.remaining().has_value());
}

TEST(MemoryStreamTest, sink_appends) {
    stream::memory_sink sink;
    std::vector<uint8_t> a{1, 2};
    std::vector<uint8_t> b{3};
    async::run_blocking(sink.write_all(a));
    async::run_blocking(sink.write_all(b));
    EXPECT_EQ((std::vector<uint8_t>{1, 2, 3}), sink.bytes());
    auto released = sink.release();
    EXPECT_EQ(3u, released.size());
}
