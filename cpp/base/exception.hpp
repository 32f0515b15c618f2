#pragma once

/**
 * @file exception.hpp
 * @brief Definition of the `exception` class.
 */

#include "format.hpp"

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace base {

/**
 * @brief Base class for all aproto exceptions.
 *
 * Besides the human readable message every exception carries a map of named parameters,
 * so that callers can inspect the offending values without parsing the message.
 */
class exception : public std::exception
{
public:
    using params_t = std::map<std::string, std::string, std::less<>>;

public:
    explicit exception(std::string&& what)
        : what_(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : what_(std::move(what))
        , params_(std::move(params))
    {
    }

    const char* what() const noexcept override
    {
        return what_.c_str();
    }

    const std::string& message() const noexcept
    {
        return what_;
    }

    const auto& params() const noexcept
    {
        return params_;
    }

    /**
     * @brief Prepends `frame` to the "context" parameter. Nested decoders call it while the exception
     * propagates, so the parameter ends up as the path to the failed value, e.g. `config.servers.port`.
     */
    void add_context(std::string_view frame)
    {
        auto& context = params_["context"];
        context = context.empty() ? std::string(frame) : std::string(frame) + "." + context;
    }

    /// Returns the parameter with the given name or an empty string.
    std::string param(std::string_view name) const
    {
        auto it = params_.find(name);
        return it == params_.end() ? std::string() : it->second;
    }

private:
    std::string what_;
    params_t params_;
};

} // namespace base
