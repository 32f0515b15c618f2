#pragma once

/**
 * @file logger_adapter.hpp
 * @brief Interface of the log backends registered in `base::logger`.
 */

#include "logger.hpp"

#include <string>

namespace base {

class logger_adapter
{
public:
    virtual ~logger_adapter() = default;

    [[nodiscard]] virtual const std::string name() const = 0;

    /// Returns false if the records of the given level are dropped anyway, so they are not formatted at all.
    [[nodiscard]] virtual bool accepts(log_level) const
    {
        return true;
    }

    virtual void log(log_level level, const std::string& channel, const std::string& message) = 0;
};

} // namespace base
