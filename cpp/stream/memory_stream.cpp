#include "memory_stream.hpp"
#include "exceptions.hpp"

#include <algorithm>

namespace stream {

async::task<void> memory_source::read_exact(std::span<uint8_t> buffer)
{
    const auto available = bytes_.size() - position_;
    const auto n = std::min(available, buffer.size());
    std::copy_n(bytes_.begin() + position_, n, buffer.begin());
    position_ += n;
    if (n < buffer.size()) {
        throw unexpected_end_of_stream(buffer.size(), n);
    }
    co_return;
}

async::task<void> memory_sink::write_all(std::span<const uint8_t> bytes)
{
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    co_return;
}

} // namespace stream
