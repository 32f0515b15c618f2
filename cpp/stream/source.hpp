#pragma once

/**
 * @file source.hpp
 * @brief Definition of the `source` and `sink` interfaces.
 */

#include <async/task.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace stream {

/**
 * @brief Readable half of a byte oriented transport.
 */
class source
{
public:
    virtual ~source() = default;

    /**
     * @brief Suspends until exactly `buffer.size()` bytes are read into `buffer`.
     *
     * @throws unexpected_end_of_stream If the transport is closed before all the bytes arrived.
     * @throws io_error On transport failure.
     */
    virtual async::task<void> read_exact(std::span<uint8_t> buffer) = 0;

    /**
     * @brief The upper bound of the bytes which can still be read, if the source knows it.
     * Sources backed by memory know it, network transports generally don't.
     */
    [[nodiscard]] virtual std::optional<uint64_t> remaining() const
    {
        return std::nullopt;
    }
};

/**
 * @brief Writable half of a byte oriented transport.
 */
class sink
{
public:
    virtual ~sink() = default;

    /**
     * @brief Suspends until all the bytes are accepted by the transport.
     *
     * @throws io_error On transport failure.
     */
    virtual async::task<void> write_all(std::span<const uint8_t> bytes) = 0;
};

} // namespace stream
