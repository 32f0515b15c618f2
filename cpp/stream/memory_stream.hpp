#pragma once

/**
 * @file memory_stream.hpp
 * @brief In-memory implementations of `source` and `sink`.
 */

#include "source.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace stream {

/**
 * @brief Reads from a caller owned byte range. Never suspends.
 *
 * An open ended source holds only the bytes received so far, more may follow later. It doesn't report
 * the remaining size, so the decode budget is not limited by the bytes which happen to be buffered.
 */
class memory_source : public source
{
public:
    explicit memory_source(std::span<const uint8_t> bytes, bool open_ended = false) noexcept
        : bytes_(bytes)
        , open_ended_(open_ended)
    {
    }

    async::task<void> read_exact(std::span<uint8_t> buffer) override;

    [[nodiscard]] std::optional<uint64_t> remaining() const override
    {
        if (open_ended_) {
            return std::nullopt;
        }
        return bytes_.size() - position_;
    }

    /// Number of bytes consumed so far.
    [[nodiscard]] std::size_t position() const noexcept
    {
        return position_;
    }

private:
    std::span<const uint8_t> bytes_;
    std::size_t position_ = 0;
    bool open_ended_;
};

/**
 * @brief Appends everything written to an owned buffer.
 */
class memory_sink : public sink
{
public:
    memory_sink() = default;

    async::task<void> write_all(std::span<const uint8_t> bytes) override;

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept
    {
        return bytes_;
    }

    std::vector<uint8_t> release() noexcept
    {
        return std::move(bytes_);
    }

private:
    std::vector<uint8_t> bytes_;
};

} // namespace stream
