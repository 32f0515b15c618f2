#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `codec` module.
 */

#include <base/exception.hpp>
#include <stream/exceptions.hpp>

#include <cstdint>
#include <string>

namespace codec {

/// Transport level errors are raised by the stream adapters and propagate unchanged.
using io_error = stream::io_error;
using unexpected_end_of_stream = stream::unexpected_end_of_stream;

class exception : public base::exception
{
public:
    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }

    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

class invalid_text : public exception
{
public:
    explicit invalid_text(uint64_t offset)
        : exception(fmt::format("Text is not valid UTF-8: invalid byte at offset {}", offset),
                    {{"offset", std::to_string(offset)}})
    {
    }
};

class invalid_boolean : public exception
{
public:
    explicit invalid_boolean(uint8_t value)
        : exception(fmt::format("Invalid boolean byte {:#04x}, expected 0x00 or 0x01", value),
                    {{"value", std::to_string(value)}})
    {
    }
};

class unknown_variant : public exception
{
public:
    unknown_variant(uint64_t value, std::string type_name)
        : exception(fmt::format("Unknown variant {} of {}", value, type_name),
                    {{"value", std::to_string(value)}, {"type", type_name}})
        , value_(value)
    {
    }

    uint64_t value() const noexcept
    {
        return value_;
    }

private:
    uint64_t value_;
};

/// A length field requests more than the remaining decode budget.
class oversized_request : public exception
{
public:
    oversized_request(uint64_t requested, uint64_t remaining)
        : exception(fmt::format("Oversized request: {} bytes requested, {} bytes remaining in the decode budget",
                                requested, remaining),
                    {{"requested", std::to_string(requested)}, {"remaining", std::to_string(remaining)}})
    {
    }

protected:
    oversized_request(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

/// The allocator refused the request, which was within the decode budget.
class allocation_failed : public oversized_request
{
public:
    explicit allocation_failed(uint64_t requested)
        : oversized_request(fmt::format("Allocation of {} bytes failed", requested),
                            {{"requested", std::to_string(requested)}})
    {
    }
};

class depth_exceeded : public exception
{
public:
    explicit depth_exceeded(uint32_t max_depth)
        : exception(fmt::format("Maximum nesting depth {} exceeded", max_depth),
                    {{"maxDepth", std::to_string(max_depth)}})
    {
    }
};

class length_limit_exceeded : public exception
{
public:
    length_limit_exceeded(uint64_t length, uint64_t max_length)
        : exception(fmt::format("Length {} exceeds the limit {}", length, max_length),
                    {{"length", std::to_string(length)}, {"maxLength", std::to_string(max_length)}})
    {
    }
};

class negative_duration : public exception
{
public:
    negative_duration()
        : exception("Negative durations can't be encoded")
    {
    }
};

/// Escape hatch for user written and adapter codecs.
class custom_failure : public exception
{
public:
    explicit custom_failure(std::string message)
        : exception(fmt::format("Custom codec failure: {}", message), {{"message", message}})
    {
    }
};

} // namespace codec
