#pragma once

/**
 * @file pod_serializable.hpp
 * @brief Wire format of booleans, integers, floating point numbers and bytes.
 *
 * All the multi byte values are big-endian. Floating point numbers are written as the big-endian
 * integer with the same IEEE-754 bit pattern.
 */

#include "exceptions.hpp"
#include "serializable.hpp"
#include "serializer.hpp"

#include <boost/endian/conversion.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

namespace codec {

namespace impl {

template <typename T>
requires std::is_integral_v<T>
inline async::task<T> read_big_endian(reader& r)
{
    std::array<uint8_t, sizeof(T)> bytes{};
    co_await r.read_bytes(bytes);
    T value;
    std::memcpy(&value, bytes.data(), sizeof(T));
    co_return boost::endian::big_to_native(value);
}

template <typename T>
requires std::is_integral_v<T>
inline async::task<void> write_big_endian(T value, writer& w)
{
    value = boost::endian::native_to_big(value);
    std::array<uint8_t, sizeof(T)> bytes{};
    std::memcpy(bytes.data(), &value, sizeof(T));
    co_await w.write_bytes(bytes);
}

template <std::size_t N>
struct unsigned_of_size;

template <>
struct unsigned_of_size<4>
{
    using type = uint32_t;
};

template <>
struct unsigned_of_size<8>
{
    using type = uint64_t;
};

} // namespace impl

template <typename T>
requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct serializable<T>
{
    static constexpr uint64_t min_size = sizeof(T);

    inline static async::task<T> read(reader& r)
    {
        return impl::read_big_endian<T>(r);
    }

    inline static async::task<void> write(const T& o, writer& w)
    {
        return impl::write_big_endian<T>(o, w);
    }
};

template <>
struct serializable<bool>
{
    static constexpr uint64_t min_size = 1;

    static async::task<bool> read(reader& r)
    {
        auto b = co_await impl::read_big_endian<uint8_t>(r);
        if (b > 1) {
            throw invalid_boolean(b);
        }
        co_return b == 1;
    }

    inline static async::task<void> write(const bool& o, writer& w)
    {
        return impl::write_big_endian<uint8_t>(o ? 1 : 0, w);
    }
};

template <typename T>
requires std::is_floating_point_v<T> && std::numeric_limits<T>::is_iec559 && (sizeof(T) == 4 || sizeof(T) == 8)
struct serializable<T>
{
    using bits_t = typename impl::unsigned_of_size<sizeof(T)>::type;

    static constexpr uint64_t min_size = sizeof(T);

    static async::task<T> read(reader& r)
    {
        auto bits = co_await impl::read_big_endian<bits_t>(r);
        co_return std::bit_cast<T>(bits);
    }

    inline static async::task<void> write(const T& o, writer& w)
    {
        return impl::write_big_endian<bits_t>(std::bit_cast<bits_t>(o), w);
    }
};

template <>
struct serializable<std::byte>
{
    static constexpr uint64_t min_size = 1;

    static async::task<std::byte> read(reader& r)
    {
        auto b = co_await impl::read_big_endian<uint8_t>(r);
        co_return static_cast<std::byte>(b);
    }

    inline static async::task<void> write(const std::byte& o, writer& w)
    {
        return impl::write_big_endian<uint8_t>(static_cast<uint8_t>(o), w);
    }
};

} // namespace codec
