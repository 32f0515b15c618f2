#include "base.hpp"
#include "spdlog_adapter.hpp"

#include <atomic>
#include <mutex>

namespace base {

namespace {

logger& instance()
{
    static logger l;
    return l;
}

std::atomic<bool> initialized = false;
std::mutex init_mutex;

}

void initialize(std::shared_ptr<logger_adapter> adapter)
{
    std::lock_guard lock(init_mutex);
    instance().clear();
    if (adapter) {
        instance().add(std::move(adapter));
    }
    initialized = true;
}

void deinitialize()
{
    std::lock_guard lock(init_mutex);
    instance().clear();
    initialized = false;
}

bool is_initialized()
{
    return initialized;
}

logger& get_logger()
{
    if (!initialized) {
        std::lock_guard lock(init_mutex);
        if (!initialized) {
            instance().add(std::make_shared<spdlog_adapter>());
            initialized = true;
        }
    }
    return instance();
}

} // namespace base
