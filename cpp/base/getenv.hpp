#pragma once

/**
 * @file getenv.hpp
 * @brief Typed access to the environment variables used for configuration.
 */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>

namespace base {

/// Returns the raw value of the variable, or `std::nullopt` if it is not set.
inline std::optional<std::string> getenv_raw(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

/**
 * @brief Reads the variable `name` and converts it to `T`.
 *
 * Returns `default_value` when the variable is not set or can't be parsed as `T`.
 * Booleans accept `1`, `true` and `yes` (case insensitive) as true. Integers must be
 * entirely numeric, out of range values are rejected.
 */
template <typename T>
requires std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_integral_v<T>
inline T getenv(const std::string& name, T default_value = T{})
{
    auto value = getenv_raw(name);
    if (!value) {
        return default_value;
    }

    if constexpr (std::is_same_v<T, std::string>) {
        return *value;
    } else if constexpr (std::is_same_v<T, bool>) {
        auto str = *value;
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return str == "1" || str == "true" || str == "yes";
    } else {
        T result{};
        const auto* first = value->data();
        const auto* last = first + value->size();
        auto [ptr, ec] = std::from_chars(first, last, result);
        if (ec != std::errc() || ptr != last) {
            return default_value;
        }
        return result;
    }
}

} // namespace base
