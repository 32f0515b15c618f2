#pragma once

/**
 * @file adapters.hpp
 * @brief Wire formats borrowed from other representations: a proxy type, text, or the integer of a flag set.
 */

#include "layout.hpp"

#include <codec/exceptions.hpp>
#include <codec/pod_serializable.hpp>
#include <codec/serializer.hpp>
#include <codec/stl_common.hpp>

#include <exception>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>

namespace derive {

template <typename T>
concept proxied = requires { typename via_layout<T>::proxy_type; };

template <typename T>
concept string_represented = requires(const T& o, const std::string& s) {
    { string_layout<T>::to_string(o) } -> std::convertible_to<std::string>;
    { string_layout<T>::from_string(s) } -> std::same_as<T>;
};

template <typename T>
concept flag_set = std::is_enum_v<T> && requires { bitflags_layout<T>::mask; };

/// Bitwise OR of the underlying values of the flags.
template <typename T>
constexpr std::underlying_type_t<T> make_mask(std::initializer_list<T> flags) noexcept
{
    std::underlying_type_t<T> mask = 0;
    for (auto f : flags) {
        mask |= static_cast<std::underlying_type_t<T>>(f);
    }
    return mask;
}

namespace impl {

/**
 * @brief Runs the user supplied conversion. Failures other than the codec's own become `codec::custom_failure`.
 */
template <typename F>
inline auto convert(F&& f) -> decltype(std::forward<F>(f)())
{
    try {
        return std::forward<F>(f)();
    } catch (const base::exception&) {
        throw;
    } catch (const std::exception& e) {
        throw codec::custom_failure(e.what());
    }
}

} // namespace impl

} // namespace derive

namespace codec {

/**
 * @brief Encoded as `via_layout<T>::proxy_type`. `T` converts to the proxy with `static_cast` on write,
 * and the proxy back to `T` on read. Throwing conversion fails the operation.
 */
template <derive::proxied T>
struct serializable<T>
{
    using proxy_t = typename derive::via_layout<T>::proxy_type;

    static constexpr uint64_t min_size = min_size_v<proxy_t>;

    static async::task<T> read(reader& r)
    {
        auto proxy = co_await codec::read<proxy_t>(r);
        co_return derive::impl::convert([&proxy] {
            return static_cast<T>(std::move(proxy));
        });
    }

    static async::task<void> write(const T& o, writer& w)
    {
        auto proxy = derive::impl::convert([&o] {
            return static_cast<proxy_t>(o);
        });
        co_await codec::write(proxy, w);
    }
};

/**
 * @brief Encoded as text, produced by `string_layout<T>::to_string` and parsed by `string_layout<T>::from_string`.
 */
template <derive::string_represented T>
struct serializable<T>
{
    static constexpr uint64_t min_size = sizeof(length_t);

    static async::task<T> read(reader& r)
    {
        auto text = co_await read_text<std::string>(r);
        co_return derive::impl::convert([&text] {
            return derive::string_layout<T>::from_string(text);
        });
    }

    static async::task<void> write(const T& o, writer& w)
    {
        auto text = derive::impl::convert([&o] {
            return std::string(derive::string_layout<T>::to_string(o));
        });
        co_await write_text(text, w);
    }
};

/**
 * @brief Encoded as the underlying integer. The bits which don't belong to any declared flag are dropped on read.
 */
template <derive::flag_set T>
struct serializable<T>
{
    using underlying_t = std::underlying_type_t<T>;

    static constexpr uint64_t min_size = sizeof(underlying_t);

    static async::task<T> read(reader& r)
    {
        auto bits = co_await codec::read<underlying_t>(r);
        co_return static_cast<T>(static_cast<underlying_t>(bits & derive::bitflags_layout<T>::mask));
    }

    inline static async::task<void> write(const T& o, writer& w)
    {
        return codec::write(static_cast<underlying_t>(o), w);
    }
};

} // namespace codec
