#include "context.hpp"
#include "exceptions.hpp"

#include <base/assert.hpp>

#include <algorithm>
#include <limits>

namespace codec {

namespace {

uint64_t limit_of(const stream::source& source, const options& o)
{
    return std::min(o.max_decode_bytes, source.remaining().value_or(std::numeric_limits<uint64_t>::max()));
}

}

depth_guard::depth_guard(reader& r)
    : reader_(r)
{
    if (reader_.depth_ >= reader_.options_.max_depth) {
        throw depth_exceeded(reader_.options_.max_depth);
    }
    ++reader_.depth_;
}

depth_guard::~depth_guard()
{
    ASSERT(reader_.depth_ > 0);
    --reader_.depth_;
}

reader::reader(stream::source& source, const options& o)
    : source_(source)
    , options_(o)
    , budget_(limit_of(source, o), limit_of(source, o))
{
}

async::task<void> reader::read_bytes(std::span<uint8_t> buffer)
{
    co_await source_.read_exact(buffer);
    position_ += buffer.size();
    budget_.consume(buffer.size());
}

async::task<void> writer::write_bytes(std::span<const uint8_t> bytes)
{
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    position_ += bytes.size();
    if (pending_.size() >= flush_threshold) {
        co_await flush();
    }
}

async::task<void> writer::flush()
{
    if (pending_.empty()) {
        co_return;
    }
    auto chunk = std::move(pending_);
    pending_.clear();
    co_await sink_.write_all(chunk);
}

} // namespace codec
