#include <gtest/gtest.h>
#include "../../codec/codec.hpp"
#include "../../stream/asio_stream.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <map>
#include <string>
#include <vector>

namespace {

using socket_t = boost::asio::local::stream_protocol::socket;

struct socket_pair {
    explicit socket_pair(boost::asio::io_context& context)
        : left(context)
        , right(context) {
        boost::asio::local::connect_pair(left, right);
    }

    socket_t left;
    socket_t right;
};

async::task<void> send_and_close(std::map<std::string, std::vector<int32_t>> value, socket_t& socket) {
    stream::asio_stream<socket_t> out(socket);
    co_await codec::encode(value, out);
    socket.close();
}

}

TEST(AsioStreamTest, round_trip_over_socket) {
    boost::asio::io_context context;
    socket_pair sockets(context);
    std::map<std::string, std::vector<int32_t>> value{{"a", {1, 2, 3}}, {"b", {}}, {"c", std::vector<int32_t>(5000, 7)}};

    boost::asio::co_spawn(context, send_and_close(value, sockets.left), boost::asio::detached);
    stream::asio_stream<socket_t> in(sockets.right);
    auto decoded = async::run_blocking(context, codec::decode<std::map<std::string, std::vector<int32_t>>>(in));
    EXPECT_EQ(value, decoded);
}

TEST(AsioStreamTest, closed_socket_is_end_of_stream) {
    boost::asio::io_context context;
    socket_pair sockets(context);
    std::vector<uint8_t> half{0x00, 0x01};
    boost::asio::write(sockets.left, boost::asio::buffer(half));
    sockets.left.close();

    stream::asio_stream<socket_t> in(sockets.right);
    EXPECT_THROW(async::run_blocking(context, codec::decode<uint32_t>(in)), stream::unexpected_end_of_stream);
}

TEST(AsioStreamTest, hostile_length_on_socket_is_rejected) {
    boost::asio::io_context context;
    socket_pair sockets(context);
    // Length field claims 2^40 elements of 8 bytes, followed by a single element.
    std::vector<uint8_t> hostile{0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0, 0, 0, 0, 0, 0, 0, 1};
    boost::asio::write(sockets.left, boost::asio::buffer(hostile));
    sockets.left.close();

    stream::asio_stream<socket_t> in(sockets.right);
    EXPECT_THROW(async::run_blocking(context, codec::decode<std::vector<uint64_t>>(in, codec::options())),
                 codec::oversized_request);
}

TEST(AsioStreamTest, blocking_stream_shares_the_format) {
    boost::asio::io_context context;
    socket_pair sockets(context);
    stream::blocking_stream<socket_t> out(sockets.left);
    stream::blocking_stream<socket_t> in(sockets.right);

    const std::vector<std::string> value{"first", "second"};
    codec::encode_blocking(value, out);
    EXPECT_EQ(value, codec::decode_blocking<std::vector<std::string>>(in));

    sockets.left.close();
    EXPECT_THROW(codec::decode_blocking<bool>(in), stream::unexpected_end_of_stream);
}
