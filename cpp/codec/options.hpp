#pragma once

#include <cstdint>

namespace codec {

/**
 * @brief Limits applied to a single top-level decode operation.
 */
struct options
{
    /// Upper bound of the decode budget. The effective budget is further limited by the bytes the source can supply.
    uint64_t max_decode_bytes = uint64_t(1) << 30;

    /// Maximum nesting of derived records and unions.
    uint32_t max_depth = 128;

    /// Largest number of bytes reserved for a single container before its elements arrive.
    uint64_t preallocation_limit = uint64_t(1) << 20;

    /**
     * @brief Default options, overridden by `APROTO_MAX_DECODE_BYTES`, `APROTO_MAX_DEPTH`
     * and `APROTO_PREALLOCATION_LIMIT` when these are set.
     */
    static options from_environment();
};

} // namespace codec
