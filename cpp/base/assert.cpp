#include "assert.hpp"

#ifdef AP_ASSERTIONS

#include "base.hpp"

#include <cstdlib>

namespace base {

void abort(const std::string& message)
{
    log_error(log_channel::generic, "{}", message);
    std::abort();
}

} // namespace base

#endif // AP_ASSERTIONS
