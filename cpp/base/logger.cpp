#include "logger.hpp"
#include "logger_adapter.hpp"

namespace base {

void logger::log(log_level level, const std::string& channel, const std::string& message) const
{
    for (const auto& adapter : snapshot()) {
        adapter->log(level, channel, message);
    }
}

void logger::log(log_level level, const std::string& channel, const std::string& message,
                 const std::map<std::string, std::string, std::less<>>& params) const
{
    if (params.empty()) {
        log(level, channel, message);
        return;
    }
    std::string suffix;
    for (const auto& [k, v] : params) {
        if (!suffix.empty()) {
            suffix += ", ";
        }
        suffix += fmt::format("{}={}", k, v);
    }
    log(level, channel, fmt::format("{} [{}]", message, suffix));
}

void logger::log(log_level level, const std::string& channel, const std::string& message,
                 const fmt::format_args& args) const
{
    auto adapters = snapshot();
    std::erase_if(adapters, [level](const auto& a) {
        return !a->accepts(level);
    });
    if (adapters.empty()) {
        return;
    }
    const auto formatted = fmt::vformat(message, args);
    for (const auto& adapter : adapters) {
        adapter->log(level, channel, formatted);
    }
}

void logger::add(std::shared_ptr<logger_adapter> adapter)
{
    std::lock_guard lock(mutex_);
    adapters_.push_back(std::move(adapter));
}

void logger::remove(const std::string& name)
{
    std::lock_guard lock(mutex_);
    std::erase_if(adapters_, [&name](const auto& a) {
        return a->name() == name;
    });
}

void logger::clear()
{
    std::lock_guard lock(mutex_);
    adapters_.clear();
}

bool logger::empty() const
{
    std::lock_guard lock(mutex_);
    return adapters_.empty();
}

std::vector<std::shared_ptr<logger_adapter>> logger::snapshot() const
{
    std::lock_guard lock(mutex_);
    return adapters_;
}

} // namespace base
