#pragma once

/**
 * @file stl_serializable.hpp
 * @brief Wire format of the standard library types.
 */

#include "exceptions.hpp"
#include "pod_serializable.hpp"
#include "result.hpp"
#include "serializable.hpp"
#include "serializer.hpp"
#include "stl_common.hpp"

#include <boost/container/vector.hpp>

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace codec {

template <typename F, typename S>
struct serializable<std::pair<F, S>>
{
    using A = std::remove_cv_t<F>;
    using B = std::remove_cv_t<S>;

    static constexpr uint64_t min_size = impl::saturating_add(min_size_v<A>, min_size_v<B>);

    static async::task<std::pair<F, S>> read(reader& r)
    {
        auto first = co_await codec::read<A>(r);
        auto second = co_await codec::read<B>(r);
        co_return std::pair<F, S>(std::move(first), std::move(second));
    }

    static async::task<void> write(const std::pair<F, S>& o, writer& w)
    {
        co_await codec::write<A>(o.first, w);
        co_await codec::write<B>(o.second, w);
    }
};

template <typename... Args>
struct serializable<std::tuple<Args...>>
{
    static constexpr uint64_t min_size = impl::sum_min_size<Args...>();

    inline static async::task<std::tuple<Args...>> read(reader& r)
    {
        return read_tuple<Args...>(r);
    }

    inline static async::task<void> write(const std::tuple<Args...>& o, writer& w)
    {
        return write_tuple(o, w);
    }
};

template <>
struct serializable<std::monostate>
{
    static constexpr uint64_t min_size = 0;

    static async::task<std::monostate> read(reader&)
    {
        co_return std::monostate();
    }

    static async::task<void> write(const std::monostate&, writer&)
    {
        co_return;
    }
};

/**
 * @brief The index of the alternative is the discriminant: one byte for up to 256 alternatives, two bytes above.
 */
template <typename... Args>
struct serializable<std::variant<Args...>>
{
    using variant_t = std::variant<Args...>;
    using discriminant_t = std::conditional_t<(sizeof...(Args) <= 256), uint8_t, uint16_t>;

    static constexpr uint64_t min_size = sizeof(discriminant_t);

    static async::task<variant_t> read(reader& r)
    {
        auto index = co_await codec::read<discriminant_t>(r);
        if (index >= sizeof...(Args)) {
            throw unknown_variant(index, "std::variant");
        }
        co_return co_await impl::read_alternative<0, variant_t>(r, index);
    }

    static async::task<void> write(const variant_t& o, writer& w)
    {
        if (o.valueless_by_exception()) {
            throw custom_failure("Can't encode valueless variant");
        }
        co_await codec::write(static_cast<discriminant_t>(o.index()), w);
        co_await impl::write_alternative<0>(o, w);
    }
};

/**
 * @brief One discriminant byte, 0 for absent and 1 for present, followed by the value if present.
 */
template <typename T>
struct serializable<std::optional<T>>
{
    static constexpr uint64_t min_size = 1;

    static async::task<std::optional<T>> read(reader& r)
    {
        auto d = co_await codec::read<uint8_t>(r);
        if (d == 0) {
            co_return std::optional<T>();
        }
        if (d != 1) {
            throw unknown_variant(d, "optional");
        }
        auto value = co_await codec::read<T>(r);
        co_return std::optional<T>(std::move(value));
    }

    static async::task<void> write(const std::optional<T>& o, writer& w)
    {
        co_await codec::write<uint8_t>(o.has_value() ? 1 : 0, w);
        if (o.has_value()) {
            co_await codec::write<T>(*o, w);
        }
    }
};

/**
 * @brief Owned indirection, encoded as the optional. Self containing types must hold themselves through it.
 */
template <typename T>
struct serializable<std::unique_ptr<T>>
{
    static constexpr uint64_t min_size = 1;

    static async::task<std::unique_ptr<T>> read(reader& r)
    {
        auto d = co_await codec::read<uint8_t>(r);
        if (d == 0) {
            co_return std::unique_ptr<T>();
        }
        if (d != 1) {
            throw unknown_variant(d, "optional");
        }
        auto value = co_await codec::read<T>(r);
        std::unique_ptr<T> result;
        guard_allocation(sizeof(T), [&result, &value] {
            result = std::make_unique<T>(std::move(value));
        });
        co_return result;
    }

    static async::task<void> write(const std::unique_ptr<T>& o, writer& w)
    {
        co_await codec::write<uint8_t>(o ? 1 : 0, w);
        if (o) {
            co_await codec::write<T>(*o, w);
        }
    }
};

/**
 * @brief One discriminant byte, 0 for success and 1 for failure, followed by the held value.
 */
template <typename T, typename E>
struct serializable<result<T, E>>
{
    static constexpr uint64_t min_size = 1;

    static async::task<result<T, E>> read(reader& r)
    {
        auto d = co_await codec::read<uint8_t>(r);
        if (d == 0) {
            auto value = co_await codec::read<T>(r);
            co_return result<T, E>::success(std::move(value));
        }
        if (d != 1) {
            throw unknown_variant(d, "result");
        }
        auto error = co_await codec::read<E>(r);
        co_return result<T, E>::failure(std::move(error));
    }

    static async::task<void> write(const result<T, E>& o, writer& w)
    {
        co_await codec::write<uint8_t>(o.has_value() ? 0 : 1, w);
        if (o.has_value()) {
            co_await codec::write<T>(o.value(), w);
        } else {
            co_await codec::write<E>(o.error(), w);
        }
    }
};

/**
 * @brief Fixed size array, the elements without length field.
 */
template <typename T, std::size_t N>
struct serializable<std::array<T, N>>
{
    static constexpr uint64_t min_size = impl::saturating_mul(min_size_v<T>, N);

    static std::array<T, N> construct()
    {
        return []<std::size_t... I>(std::index_sequence<I...>) {
            return std::array<T, N>{((void)I, serializer<T>::construct())...};
        }(std::make_index_sequence<N>());
    }

    static async::task<std::array<T, N>> read(reader& r)
    {
        auto result = construct();
        if constexpr (impl::is_byte_v<T>) {
            co_await r.read_bytes(std::span<uint8_t>(reinterpret_cast<uint8_t*>(result.data()), N));
        } else {
            for (auto& e : result) {
                auto value = co_await codec::read<T>(r);
                e = std::move(value);
            }
        }
        co_return result;
    }

    static async::task<void> write(const std::array<T, N>& o, writer& w)
    {
        if constexpr (impl::is_byte_v<T>) {
            co_await w.write_bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(o.data()), N));
        } else {
            for (const auto& e : o) {
                co_await codec::write(e, w);
            }
        }
    }
};

namespace impl {

/**
 * @brief Common implementation of the length prefixed containers.
 */
template <typename Container>
struct container_serializable
{
    static constexpr uint64_t min_size = sizeof(length_t);

    inline static async::task<Container> read(reader& r)
    {
        return read_container<Container>(r);
    }

    inline static async::task<Container> read_limited(reader& r, uint64_t max_length)
    {
        return read_container<Container>(r, max_length);
    }

    inline static async::task<void> write(const Container& o, writer& w)
    {
        return write_container(o, w);
    }

    static uint64_t length(const Container& o) noexcept
    {
        return o.size();
    }
};

} // namespace impl

template <typename T, typename A>
struct serializable<std::vector<T, A>> : impl::container_serializable<std::vector<T, A>>
{
};

template <typename T, typename A, typename O>
struct serializable<boost::container::vector<T, A, O>> : impl::container_serializable<boost::container::vector<T, A, O>>
{
};

template <typename T, typename O, typename A>
struct serializable<std::set<T, O, A>> : impl::container_serializable<std::set<T, O, A>>
{
};

template <typename T, typename H, typename O, typename A>
struct serializable<std::unordered_set<T, H, O, A>> : impl::container_serializable<std::unordered_set<T, H, O, A>>
{
};

template <typename K, typename V, typename O, typename A>
struct serializable<std::map<K, V, O, A>> : impl::container_serializable<std::map<K, V, O, A>>
{
};

template <typename K, typename V, typename H, typename O, typename A>
struct serializable<std::unordered_map<K, V, H, O, A>>
    : impl::container_serializable<std::unordered_map<K, V, H, O, A>>
{
};

/**
 * @brief Text: the byte count, followed by UTF-8 bytes. Invalid UTF-8 is rejected in both directions.
 */
template <typename Traits, typename A>
struct serializable<std::basic_string<char, Traits, A>>
{
    using string_t = std::basic_string<char, Traits, A>;

    static constexpr uint64_t min_size = sizeof(length_t);

    inline static async::task<string_t> read(reader& r)
    {
        return read_text<string_t>(r);
    }

    inline static async::task<string_t> read_limited(reader& r, uint64_t max_length)
    {
        return read_text<string_t>(r, max_length);
    }

    inline static async::task<void> write(const string_t& o, writer& w)
    {
        return write_text(o, w);
    }

    static uint64_t length(const string_t& o) noexcept
    {
        return o.size();
    }
};

} // namespace codec
