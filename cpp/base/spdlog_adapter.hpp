#pragma once

/**
 * @file spdlog_adapter.hpp
 * @brief Logger adapter which forwards the records to spdlog.
 */

#include "logger_adapter.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace base {

class spdlog_adapter : public logger_adapter
{
public:
    /// Creates the adapter with stderr sink, using the level from `APROTO_LOG_LEVEL` (warning by default).
    spdlog_adapter();

    explicit spdlog_adapter(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] const std::string name() const override
    {
        return "spdlog";
    }

    [[nodiscard]] bool accepts(log_level level) const override;

    void log(log_level level, const std::string& channel, const std::string& message) override;

    void set_level(log_level level);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace base
