#include "options.hpp"

#include <base/getenv.hpp>

namespace codec {

options options::from_environment()
{
    options o;
    o.max_decode_bytes = base::getenv<uint64_t>("APROTO_MAX_DECODE_BYTES", o.max_decode_bytes);
    o.max_depth = base::getenv<uint32_t>("APROTO_MAX_DEPTH", o.max_depth);
    o.preallocation_limit = base::getenv<uint64_t>("APROTO_PREALLOCATION_LIMIT", o.preallocation_limit);
    return o;
}

} // namespace codec
