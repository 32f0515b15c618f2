#pragma once

/**
 * @file stl_common.hpp
 * @brief Shared building blocks of the container, tuple and variant codecs.
 */

#include "exceptions.hpp"
#include "pod_serializable.hpp"
#include "serializer.hpp"

#include <base/utf8.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <tuple>
#include <utility>
#include <variant>

namespace codec {

/// Length fields are unsigned 64-bit integers.
using length_t = uint64_t;

inline constexpr uint64_t no_length_limit = std::numeric_limits<uint64_t>::max();

/**
 * @brief Runs `f`, converting the allocator failure into `allocation_failed`.
 *
 * @param bytes The size of the allocation, reported in the error.
 */
template <typename F>
inline void guard_allocation(uint64_t bytes, F&& f)
{
    try {
        std::forward<F>(f)();
    } catch (const std::bad_alloc&) {
        throw allocation_failed(bytes);
    }
}

/**
 * @brief Reads the length field and checks it against `max_length`.
 *
 * @throws oversized_request If the length is above `max_length`.
 */
inline async::task<uint64_t> read_length(reader& r, uint64_t max_length = no_length_limit)
{
    auto length = co_await impl::read_big_endian<length_t>(r);
    if (length > max_length) {
        throw oversized_request(length, max_length);
    }
    co_return length;
}

inline async::task<void> write_length(uint64_t length, writer& w)
{
    return impl::write_big_endian<length_t>(length, w);
}

namespace impl {

template <typename Container>
concept reservable = requires(Container& c, std::size_t n) { c.reserve(n); };

template <typename Container>
concept map_like = requires { typename Container::mapped_type; };

template <typename Container>
concept sequence_like = requires(Container& c, typename Container::value_type&& v) { c.push_back(std::move(v)); };

template <typename Container>
concept blob_like = is_byte_v<typename Container::value_type> && requires(Container& c, std::size_t n) {
    c.resize(n);
    c.data();
};

/**
 * @brief Reserves the capacity for the first elements of the container. The reserved memory is limited
 * by `options::preallocation_limit`, the rest grows while the elements actually arrive.
 */
template <typename Container>
inline void reserve_capacity(Container& c, uint64_t count, const options& o)
{
    if constexpr (reservable<Container>) {
        using V = typename Container::value_type;
        const auto element_size = std::max<uint64_t>(sizeof(V), 1);
        const auto n = std::min<uint64_t>(count, o.preallocation_limit / element_size);
        guard_allocation(n * element_size, [&c, n] {
            c.reserve(static_cast<std::size_t>(n));
        });
    }
}

/// Element type of the container as it appears on the wire.
template <typename Container>
struct element
{
    using type = typename Container::value_type;
};

template <map_like Container>
struct element<Container>
{
    using type = std::pair<typename Container::key_type, typename Container::mapped_type>;
};

template <typename Container>
using element_t = typename element<Container>::type;

/**
 * @brief Reads `length` bytes into contiguous byte container. The container grows chunk by chunk,
 * so the memory never exceeds the bytes actually received plus one chunk.
 */
template <typename Container>
async::task<Container> read_blob(reader& r, uint64_t length)
{
    r.budget().claim(length, 1);
    r.budget().release(length);
    auto result = Container();
    const auto chunk = std::max<uint64_t>(r.config().preallocation_limit, 1);
    uint64_t received = 0;
    while (received < length) {
        const auto n = std::min(chunk, length - received);
        guard_allocation(received + n, [&result, received, n] {
            result.resize(static_cast<std::size_t>(received + n));
        });
        auto* data = reinterpret_cast<uint8_t*>(result.data()) + received;
        co_await r.read_bytes(std::span<uint8_t>(data, static_cast<std::size_t>(n)));
        received += n;
    }
    co_return result;
}

template <typename Container>
async::task<Container> read_elements(reader& r, uint64_t length)
{
    using E = element_t<Container>;
    constexpr auto element_size = min_size_v<E>;
    r.budget().claim(length, element_size);
    auto result = Container();
    reserve_capacity(result, length, r.config());
    for (uint64_t i = 0; i < length; ++i) {
        r.budget().release(element_size);
        auto e = co_await codec::read<E>(r);
        guard_allocation(sizeof(E), [&result, &e] {
            if constexpr (map_like<Container>) {
                result.insert_or_assign(std::move(e.first), std::move(e.second));
            } else if constexpr (sequence_like<Container>) {
                result.push_back(std::move(e));
            } else {
                result.insert(std::move(e));
            }
        });
    }
    co_return result;
}

} // namespace impl

/**
 * @brief Utility to read length prefixed container - vector, string, boost::container::vector, map, set.
 * Byte containers are read in one piece, the rest element by element. For maps the later duplicate key wins.
 *
 * @tparam Container
 * @param r
 * @param max_length The limit of the length field.
 */
template <typename Container>
async::task<Container> read_container(reader& r, uint64_t max_length = no_length_limit)
{
    auto length = co_await read_length(r, max_length);
    if constexpr (impl::blob_like<Container>) {
        co_return co_await impl::read_blob<Container>(r, length);
    } else {
        co_return co_await impl::read_elements<Container>(r, length);
    }
}

/**
 * @brief Utility to write length prefixed container, the elements are written in iteration order.
 */
template <typename Container>
async::task<void> write_container(const Container& o, writer& w)
{
    co_await write_length(o.size(), w);
    if constexpr (impl::blob_like<Container>) {
        auto* data = reinterpret_cast<const uint8_t*>(o.data());
        co_await w.write_bytes(std::span<const uint8_t>(data, o.size()));
    } else {
        for (const auto& e : o) {
            if constexpr (impl::map_like<Container>) {
                co_await codec::write(e.first, w);
                co_await codec::write(e.second, w);
            } else {
                co_await codec::write(e, w);
            }
        }
    }
}

/**
 * @brief Utility to read UTF-8 text.
 *
 * @throws invalid_text If the bytes are not valid UTF-8.
 */
template <typename String>
async::task<String> read_text(reader& r, uint64_t max_length = no_length_limit)
{
    auto length = co_await read_length(r, max_length);
    auto text = co_await impl::read_blob<String>(r, length);
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    if (auto invalid = base::find_invalid_utf8(bytes)) {
        throw invalid_text(*invalid);
    }
    co_return text;
}

template <typename String>
async::task<void> write_text(const String& o, writer& w)
{
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(o.data()), o.size());
    if (auto invalid = base::find_invalid_utf8(bytes)) {
        throw invalid_text(*invalid);
    }
    co_await write_container(o, w);
}

namespace impl {

template <std::size_t index, typename Tuple>
async::task<void> read_tuple(reader& r, Tuple& result)
{
    if constexpr (index < std::tuple_size_v<Tuple>) {
        using T = std::tuple_element_t<index, Tuple>;
        auto value = co_await codec::read<T>(r);
        std::get<index>(result) = std::move(value);
        co_await read_tuple<index + 1>(r, result);
    }
    co_return;
}

template <std::size_t index, typename Tuple>
async::task<void> write_tuple(const Tuple& o, writer& w)
{
    if constexpr (index < std::tuple_size_v<Tuple>) {
        co_await codec::write(std::get<index>(o), w);
        co_await write_tuple<index + 1>(o, w);
    }
    co_return;
}

template <typename... Args>
constexpr uint64_t sum_min_size() noexcept
{
    uint64_t size = 0;
    ((size = saturating_add(size, min_size_v<Args>)), ...);
    return size;
}

/**
 * @brief Reads the alternative `i` of `Variant` and constructs `Result` with it in place.
 * `Result` is either the variant itself or a type inheriting its constructors. `i` must be in range.
 */
template <std::size_t index, typename Variant, typename Result = Variant>
async::task<Result> read_alternative(reader& r, uint64_t i)
{
    if constexpr (index + 1 < std::variant_size_v<Variant>) {
        if (i != index) {
            co_return co_await read_alternative<index + 1, Variant, Result>(r, i);
        }
    }
    using T = std::variant_alternative_t<index, Variant>;
    auto value = co_await codec::read<T>(r);
    co_return Result(std::in_place_index<index>, std::move(value));
}

template <std::size_t index, typename Variant>
async::task<void> write_alternative(const Variant& o, writer& w)
{
    if constexpr (index + 1 < std::variant_size_v<Variant>) {
        if (o.index() != index) {
            co_await write_alternative<index + 1>(o, w);
            co_return;
        }
    }
    co_await codec::write(*std::get_if<index>(&o), w);
}

} // namespace impl

/**
 * @brief Utility to read tuple like objects, each element in order.
 */
template <typename... Args>
async::task<std::tuple<Args...>> read_tuple(reader& r)
{
    auto result = std::tuple<Args...>(serializer<Args>::construct()...);
    co_await impl::read_tuple<0>(r, result);
    co_return result;
}

template <typename Tuple>
inline async::task<void> write_tuple(const Tuple& o, writer& w)
{
    return impl::write_tuple<0>(o, w);
}

} // namespace codec
