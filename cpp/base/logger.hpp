#pragma once

/**
 * @file logger.hpp
 * @brief Definition of the `logger` class.
 */

#include "format.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace base {
class logger_adapter;

enum class log_level : unsigned char
{
    debug,
    info,
    warning,
    error
};

inline std::string log_level_to_str(const log_level t)
{
    switch (t) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    }
    return "unknown";
}

/**
 * @brief Parses the level name, case insensitive. Returns `std::nullopt` for unknown names.
 */
inline std::optional<log_level> str_to_log_level(const std::string& level)
{
    auto final_string = level;
    std::ranges::transform(final_string, final_string.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (final_string == "DEBUG") {
        return log_level::debug;
    }
    if (final_string == "INFO") {
        return log_level::info;
    }
    if (final_string == "WARN" || final_string == "WARNING") {
        return log_level::warning;
    }
    if (final_string == "ERROR") {
        return log_level::error;
    }
    return std::nullopt;
}

/**
 * @brief Dispatches formatted log records to every registered adapter.
 */
class logger
{
public:
    logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger& operator=(logger&&) = delete;
    ~logger() = default;

    void log(log_level level, const std::string& channel, const std::string& message) const;

    void log(log_level level, const std::string& channel, const std::string& message,
             const std::map<std::string, std::string, std::less<>>& params) const;

    void log(log_level level, const std::string& channel, const std::string& message, const fmt::format_args& args) const;

    void add(std::shared_ptr<logger_adapter> adapter);

    void remove(const std::string& name);

    void clear();

    [[nodiscard]] bool empty() const;

private:
    std::vector<std::shared_ptr<logger_adapter>> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<logger_adapter>> adapters_;
};

} // namespace base
