#include "spdlog_adapter.hpp"
#include "getenv.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace base {

namespace {

spdlog::level::level_enum to_spdlog(log_level level)
{
    switch (level) {
    case log_level::debug:
        return spdlog::level::debug;
    case log_level::info:
        return spdlog::level::info;
    case log_level::warning:
        return spdlog::level::warn;
    case log_level::error:
        return spdlog::level::err;
    }
    return spdlog::level::err;
}

}

spdlog_adapter::spdlog_adapter()
    : logger_(std::make_shared<spdlog::logger>("aproto", std::make_shared<spdlog::sinks::stderr_color_sink_mt>()))
{
    auto level = str_to_log_level(getenv<std::string>("APROTO_LOG_LEVEL", "warning"));
    set_level(level.value_or(log_level::warning));
}

spdlog_adapter::spdlog_adapter(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
}

bool spdlog_adapter::accepts(log_level level) const
{
    return logger_->should_log(to_spdlog(level));
}

void spdlog_adapter::log(log_level level, const std::string& channel, const std::string& message)
{
    logger_->log(to_spdlog(level), "[{}] {}", channel, message);
}

void spdlog_adapter::set_level(log_level level)
{
    logger_->set_level(to_spdlog(level));
}

} // namespace base
