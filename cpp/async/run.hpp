#pragma once

/**
 * @file run.hpp
 * @brief Functions to drive tasks to completion from synchronous code.
 */

#include "exceptions.hpp"
#include "task.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace async {

namespace impl {

template <typename T>
task<void> store_result(task<T> t, std::optional<T>& result)
{
    result.emplace(co_await std::move(t));
}

inline task<void> store_result(task<void> t, bool& done)
{
    co_await std::move(t);
    done = true;
}

}

/**
 * @brief Runs the task on the given context until it completes and returns its result.
 * The context is restarted afterwards, so it can be used again.
 *
 * @throws task_not_completed If the context ran out of work before the task finished.
 */
template <typename T>
T run_blocking(boost::asio::io_context& context, task<T> t)
{
    std::exception_ptr error;
    auto on_done = [&error](std::exception_ptr e) {
        error = std::move(e);
    };
    if constexpr (std::is_void_v<T>) {
        bool done = false;
        boost::asio::co_spawn(context, impl::store_result(std::move(t), done), on_done);
        context.run();
        context.restart();
        if (error) {
            std::rethrow_exception(error);
        }
        if (!done) {
            throw task_not_completed();
        }
    } else {
        std::optional<T> result;
        boost::asio::co_spawn(context, impl::store_result(std::move(t), result), on_done);
        context.run();
        context.restart();
        if (error) {
            std::rethrow_exception(error);
        }
        if (!result) {
            throw task_not_completed();
        }
        return std::move(*result);
    }
}

/**
 * @brief Runs the task on a private context. Suitable for tasks which never wait for
 * an external event, e.g. the ones reading from memory or from blocking streams.
 */
template <typename T>
T run_blocking(task<T> t)
{
    boost::asio::io_context context;
    return run_blocking(context, std::move(t));
}

} // namespace async
