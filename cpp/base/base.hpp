#pragma once

#include "log_channel.hpp"
#include "logger_adapter.hpp"

#include <memory>
#include <string>

/**
 * @file base.hpp
 * @brief Definition of base module level functions.
 */

/**
 * @defgroup base
 * @{
 * @brief Defines lowest level functionality and utilities for aproto.
 *
 * @}
 */

namespace base {

/**
 * @brief initialize the base module. Replaces all the registered adapters with the given one.
 *
 * @param adapter
 */
void initialize(std::shared_ptr<logger_adapter> adapter);

/**
 * @brief deinitialize the base module. The next `get_logger` call installs the default adapter again.
 *
 */
void deinitialize();

bool is_initialized();

/**
 * @brief Returns the process wide logger. The first call installs `spdlog_adapter`, if `initialize` was not called before.
 */
logger& get_logger();

/**
 * @param channel Log channel to use
 * @param message Message to log.
 * @param args Arguments to format message with.
 */
template <typename... Args>
inline void log_debug(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::debug, channel.channel(), message, fmt::make_format_args(args...));
}

/**
 * @param channel Log channel to use
 * @param message Message to log.
 * @param args Arguments to format message with.
 */
template <typename... Args>
inline void log_info(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::info, channel.channel(), message, fmt::make_format_args(args...));
}

template <typename... Args>
inline void log_warning(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::warning, channel.channel(), message, fmt::make_format_args(args...));
}

template <typename... Args>
inline void log_error(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::error, channel.channel(), message, fmt::make_format_args(args...));
}
} // namespace base
