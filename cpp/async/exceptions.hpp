#pragma once

/**
 * @file exceptions.hpp
 * @brief Definition of the exceptions of `async` module.
 */

#include <base/exception.hpp>

namespace async {

/// @brief Base error type for `async` module.
class exception : public base::exception
{
public:
    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

class task_not_completed : public exception
{
public:
    task_not_completed()
        : exception("The task has been suspended forever: the context ran out of work before the task completed.")
    {
    }
};

} // namespace async
