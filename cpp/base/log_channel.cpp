#include "log_channel.hpp"

namespace base {

const log_channel log_channel::generic("generic");
const log_channel log_channel::codec("codec");
const log_channel log_channel::stream("stream");

} // namespace base
