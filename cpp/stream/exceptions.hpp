#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `stream` module.
 */

#include <base/exception.hpp>

#include <cstdint>
#include <string>

namespace stream {

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

/// The transport failed.
class io_error : public exception
{
public:
    explicit io_error(const std::string& message, int error_code = 0)
        : exception(fmt::format("Stream I/O error: {}", message),
                    {{"message", message}, {"errorCode", std::to_string(error_code)}})
    {
    }
};

/// The transport was closed before the requested number of bytes arrived.
class unexpected_end_of_stream : public exception
{
public:
    unexpected_end_of_stream(uint64_t requested, uint64_t received)
        : exception(fmt::format("Unexpected end of stream: requested {} bytes, received {}", requested, received),
                    {{"requested", std::to_string(requested)}, {"received", std::to_string(received)}})
    {
    }
};

} // namespace stream
