#pragma once

/**
 * @file task.hpp
 * @brief Definition of the asynchronous task type used by all the encode and decode operations.
 */

#include <utility>

#include <boost/asio/awaitable.hpp>

namespace async {

/**
 * @brief Lazily started coroutine, which produces `T`.
 *
 * Tasks suspend only when awaiting stream operations. Exceptions thrown inside the task
 * are rethrown to the awaiting coroutine.
 */
template <typename T = void>
using task = boost::asio::awaitable<T>;

} // namespace async
