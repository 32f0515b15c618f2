#pragma once

/**
 * @file asio_stream.hpp
 * @brief Stream adapters over Boost.Asio streams.
 */

#include "exceptions.hpp"
#include "source.hpp"

#include <base/base.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

namespace stream {

namespace impl {

inline void check_read(const boost::system::error_code& ec, std::size_t requested, std::size_t received)
{
    if (ec == boost::asio::error::eof) {
        base::log_debug(base::log_channel::stream, "Stream closed after {} of {} bytes", received, requested);
        throw unexpected_end_of_stream(requested, received);
    }
    if (ec) {
        base::log_warning(base::log_channel::stream, "Read failed: {}", ec.message());
        throw io_error(ec.message(), ec.value());
    }
}

inline void check_write(const boost::system::error_code& ec)
{
    if (ec) {
        base::log_warning(base::log_channel::stream, "Write failed: {}", ec.message());
        throw io_error(ec.message(), ec.value());
    }
}

}

/**
 * @brief Adapts any Asio `AsyncReadStream` + `AsyncWriteStream` (sockets, pipes, ssl streams) to
 * `source` and `sink`. The adapter does not own the stream.
 *
 * @tparam AsyncStream The Asio stream type.
 */
template <typename AsyncStream>
class asio_stream : public source, public sink
{
public:
    explicit asio_stream(AsyncStream& stream) noexcept
        : stream_(stream)
    {
    }

    async::task<void> read_exact(std::span<uint8_t> buffer) override
    {
        boost::system::error_code ec;
        auto n = co_await boost::asio::async_read(stream_, boost::asio::buffer(buffer.data(), buffer.size()),
                                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        impl::check_read(ec, buffer.size(), n);
    }

    async::task<void> write_all(std::span<const uint8_t> bytes) override
    {
        boost::system::error_code ec;
        co_await boost::asio::async_write(stream_, boost::asio::buffer(bytes.data(), bytes.size()),
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        impl::check_write(ec);
    }

    AsyncStream& next_layer() noexcept
    {
        return stream_;
    }

private:
    AsyncStream& stream_;
};

/**
 * @brief Adapts any Asio `SyncReadStream` + `SyncWriteStream` to `source` and `sink`.
 * The operations block the calling thread and never suspend the task, which makes this adapter
 * the transport of `codec::decode_blocking` and `codec::encode_blocking`.
 *
 * @tparam SyncStream The Asio stream type.
 */
template <typename SyncStream>
class blocking_stream : public source, public sink
{
public:
    explicit blocking_stream(SyncStream& stream) noexcept
        : stream_(stream)
    {
    }

    async::task<void> read_exact(std::span<uint8_t> buffer) override
    {
        boost::system::error_code ec;
        auto n = boost::asio::read(stream_, boost::asio::buffer(buffer.data(), buffer.size()), ec);
        impl::check_read(ec, buffer.size(), n);
        co_return;
    }

    async::task<void> write_all(std::span<const uint8_t> bytes) override
    {
        boost::system::error_code ec;
        boost::asio::write(stream_, boost::asio::buffer(bytes.data(), bytes.size()), ec);
        impl::check_write(ec);
        co_return;
    }

    SyncStream& next_layer() noexcept
    {
        return stream_;
    }

private:
    SyncStream& stream_;
};

} // namespace stream
