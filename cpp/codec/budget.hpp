#pragma once

/**
 * @file budget.hpp
 * @brief Definition of the `decode_budget` class.
 */

#include <cstdint>

namespace codec {

/**
 * @brief Remaining allocation allowance of one top-level decode call tree.
 *
 * The budget is expressed in bytes. Raw reads are charged after they complete. Containers
 * claim `count * min_size` bytes before allocating anything and release one element's share
 * right before each element is decoded, so the claim is replaced by the actual bytes read.
 * Element types with zero minimal size are counted against the element allowance instead.
 * The allowance is shared by the whole decode tree and is never given back, so the number of
 * such elements is bounded by the same limit as the bytes.
 */
class decode_budget
{
public:
    decode_budget(uint64_t limit, uint64_t element_limit) noexcept
        : remaining_(limit)
        , element_limit_(element_limit)
    {
    }

    /// Bytes which may still be claimed or read.
    uint64_t remaining() const noexcept
    {
        return remaining_;
    }

    /**
     * @brief Claims the space of `count` elements, each at least `min_size` bytes.
     *
     * @throws oversized_request If the claim doesn't fit into the remaining budget.
     */
    void claim(uint64_t count, uint64_t min_size);

    /// Zero-size elements which may still be claimed.
    uint64_t element_allowance() const noexcept
    {
        return element_limit_;
    }

    /// Returns `bytes` of an earlier claim back to the budget.
    void release(uint64_t bytes) noexcept
    {
        remaining_ += bytes;
    }

    /**
     * @brief Charges `bytes` which were actually read.
     *
     * @throws oversized_request If the total exceeds the budget.
     */
    void consume(uint64_t bytes);

private:
    uint64_t remaining_;
    uint64_t element_limit_;
};

} // namespace codec
