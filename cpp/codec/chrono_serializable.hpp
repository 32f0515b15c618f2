#pragma once

/**
 * @file chrono_serializable.hpp
 * @brief Wire format of `std::chrono::duration`: whole seconds as u64, then the sub-second nanoseconds as u32.
 *
 * Decoding into a duration which can't represent the value exactly fails, nothing is truncated.
 */

#include "exceptions.hpp"
#include "pod_serializable.hpp"
#include "serializable.hpp"
#include "serializer.hpp"

#include <base/type_name.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace codec {

template <typename Rep, typename Period>
requires std::is_integral_v<Rep>
struct serializable<std::chrono::duration<Rep, Period>>
{
    using duration_t = std::chrono::duration<Rep, Period>;

    static constexpr uint64_t min_size = sizeof(uint64_t) + sizeof(uint32_t);

    static async::task<duration_t> read(reader& r)
    {
        auto secs = co_await codec::read<uint64_t>(r);
        auto nanos = co_await codec::read<uint32_t>(r);
        if (nanos >= 1'000'000'000) {
            throw custom_failure(fmt::format("Duration nanoseconds {} out of range", nanos));
        }
        using seconds_ld = std::chrono::duration<long double>;
        if (secs > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ||
            seconds_ld(static_cast<long double>(secs)) > std::chrono::duration_cast<seconds_ld>(duration_t::max())) {
            throw custom_failure(fmt::format("Duration of {} seconds is out of range", secs));
        }
        const auto whole = std::chrono::seconds(static_cast<int64_t>(secs));
        const auto fraction = std::chrono::nanoseconds(nanos);
        auto s = std::chrono::duration_cast<duration_t>(whole);
        auto sub = std::chrono::duration_cast<duration_t>(fraction);
        if (std::chrono::duration_cast<std::chrono::seconds>(s) != whole ||
            std::chrono::duration_cast<std::chrono::nanoseconds>(sub) != fraction) {
            throw custom_failure(
                fmt::format("Duration of {}s {}ns is not a whole number of {}", secs, nanos, base::type_name<duration_t>()));
        }
        if (s > duration_t::max() - sub) {
            throw custom_failure(fmt::format("Duration of {}s {}ns is out of range", secs, nanos));
        }
        co_return s + sub;
    }

    static async::task<void> write(const duration_t& o, writer& w)
    {
        if (o < duration_t::zero()) {
            throw negative_duration();
        }
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(o);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(o - secs);
        co_await codec::write(static_cast<uint64_t>(secs.count()), w);
        co_await codec::write(static_cast<uint32_t>(nanos.count()), w);
    }
};

} // namespace codec
