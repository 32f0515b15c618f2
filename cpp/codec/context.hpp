#pragma once

/**
 * @file context.hpp
 * @brief Definitions of the `reader` and `writer` contexts, passed through every nested codec call.
 */

#include "budget.hpp"
#include "buffer.hpp"
#include "options.hpp"

#include <async/task.hpp>
#include <stream/source.hpp>

#include <cstdint>
#include <span>

namespace codec {

class reader;

/**
 * @brief Scoped nesting level of the decode. Throws `depth_exceeded` on construction
 * when the reader is already at the maximum depth.
 */
class depth_guard
{
public:
    explicit depth_guard(reader& r);

    depth_guard(const depth_guard&) = delete;
    depth_guard& operator=(const depth_guard&) = delete;

    ~depth_guard();

private:
    reader& reader_;
};

/**
 * @brief State of one top-level decode: the source, the decode budget and the nesting depth.
 */
class reader
{
public:
    reader(stream::source& source, const options& o);

    /// Reads exactly `buffer.size()` bytes and charges them to the budget.
    async::task<void> read_bytes(std::span<uint8_t> buffer);

    decode_budget& budget() noexcept
    {
        return budget_;
    }

    const options& config() const noexcept
    {
        return options_;
    }

    uint32_t depth() const noexcept
    {
        return depth_;
    }

    /// Total bytes read so far.
    uint64_t position() const noexcept
    {
        return position_;
    }

private:
    friend class depth_guard;

    stream::source& source_;
    const options& options_;
    decode_budget budget_;
    uint32_t depth_ = 0;
    uint64_t position_ = 0;
};

/**
 * @brief State of one top-level encode. Small writes are collected and handed to the sink in chunks.
 */
class writer
{
public:
    static constexpr std::size_t flush_threshold = 64 * 1024;

    explicit writer(stream::sink& sink) noexcept
        : sink_(sink)
    {
    }

    async::task<void> write_bytes(std::span<const uint8_t> bytes);

    /// Hands all the collected bytes to the sink.
    async::task<void> flush();

    /// Total bytes written so far, including the ones not flushed yet.
    uint64_t position() const noexcept
    {
        return position_;
    }

private:
    stream::sink& sink_;
    buffer_t pending_;
    uint64_t position_ = 0;
};

} // namespace codec
