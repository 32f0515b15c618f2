#pragma once

/**
 * @file codec.hpp
 * @brief Top-level encode and decode operations.
 */

/**
 * @defgroup codec
 * @{
 * @brief Positional binary wire format.
 *
 * Format version 1: integers are big-endian, length fields are u64, the discriminants of optional and result
 * are one byte. Values carry no type information, the decoder must know the expected type.
 *
 * @}
 */

#include "buffer.hpp"
#include "chrono_serializable.hpp"
#include "context.hpp"
#include "exceptions.hpp"
#include "options.hpp"
#include "pod_serializable.hpp"
#include "serializer.hpp"
#include "stl_serializable.hpp"

#include <async/run.hpp>
#include <base/base.hpp>
#include <base/type_name.hpp>
#include <stream/memory_stream.hpp>
#include <stream/source.hpp>

#include <optional>
#include <span>

namespace codec {

/**
 * @brief Decodes one `T` from the source.
 *
 * The decode budget of the call is `o.max_decode_bytes`, further limited by the bytes the source can still supply.
 * Any error aborts the decode. The source is left at an unspecified position afterwards.
 */
template <wire_type T>
async::task<T> decode(stream::source& source, options o = options::from_environment())
{
    reader r(source, o);
    try {
        auto value = co_await codec::read<T>(r);
        base::log_debug(base::log_channel::codec, "Decoded {} from {} bytes", base::type_name<T>(), r.position());
        co_return value;
    } catch (const oversized_request& e) {
        base::log_warning(base::log_channel::codec, "Decode of {} rejected: {}", base::type_name<T>(), e.what());
        throw;
    } catch (const depth_exceeded& e) {
        base::log_warning(base::log_channel::codec, "Decode of {} rejected: {}", base::type_name<T>(), e.what());
        throw;
    }
}

/**
 * @brief Encodes `value` to the sink. The value must outlive the returned task.
 */
template <wire_type T>
async::task<void> encode(const T& value, stream::sink& sink)
{
    writer w(sink);
    co_await codec::write(value, w);
    co_await w.flush();
    base::log_debug(base::log_channel::codec, "Encoded {} to {} bytes", base::type_name<T>(), w.position());
}

/**
 * @brief Blocking version of `decode`, for sources which never wait on external events:
 * `stream::memory_source` and `stream::blocking_stream`.
 */
template <wire_type T>
T decode_blocking(stream::source& source, options o = options::from_environment())
{
    return async::run_blocking(decode<T>(source, std::move(o)));
}

/**
 * @brief Blocking version of `encode`, for sinks which never wait on external events.
 */
template <wire_type T>
void encode_blocking(const T& value, stream::sink& sink)
{
    async::run_blocking(encode(value, sink));
}

template <wire_type T>
buffer_t to_bytes(const T& value)
{
    stream::memory_sink sink;
    encode_blocking(value, sink);
    return sink.release();
}

/**
 * @brief Decodes `T` from the beginning of `bytes`. Trailing bytes are ignored.
 */
template <wire_type T>
T from_bytes(buffer_view_t bytes, options o = options::from_environment())
{
    stream::memory_source source(bytes);
    return decode_blocking<T>(source, std::move(o));
}

/**
 * @brief Attempts to decode `T` from the bytes received so far.
 *
 * If the bytes end before the value is complete, returns `std::nullopt` and leaves the buffer untouched,
 * so that the caller can retry after more bytes arrive. On success the bytes of the value are removed
 * from the front of the buffer. Any other error is thrown.
 */
template <wire_type T>
std::optional<T> try_decode(buffer_t& buffer, options o = options::from_environment())
{
    stream::memory_source source(buffer, true);
    try {
        auto value = decode_blocking<T>(source, std::move(o));
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(source.position()));
        return value;
    } catch (const unexpected_end_of_stream&) {
        return std::nullopt;
    }
}

} // namespace codec
