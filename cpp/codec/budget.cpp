#include "budget.hpp"
#include "exceptions.hpp"

#include <limits>

namespace codec {

void decode_budget::claim(uint64_t count, uint64_t min_size)
{
    if (min_size == 0) {
        if (count > element_limit_) {
            throw oversized_request(count, element_limit_);
        }
        element_limit_ -= count;
        return;
    }
    if (count > std::numeric_limits<uint64_t>::max() / min_size) {
        throw oversized_request(std::numeric_limits<uint64_t>::max(), remaining_);
    }
    const auto bytes = count * min_size;
    if (bytes > remaining_) {
        throw oversized_request(bytes, remaining_);
    }
    remaining_ -= bytes;
}

void decode_budget::consume(uint64_t bytes)
{
    if (bytes > remaining_) {
        throw oversized_request(bytes, remaining_);
    }
    remaining_ -= bytes;
}

} // namespace codec
