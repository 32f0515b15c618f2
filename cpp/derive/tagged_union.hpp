#pragma once

/**
 * @file tagged_union.hpp
 * @brief Generated wire format of the tagged unions and of the payload-less enumerations.
 *
 * The discriminant comes first, as the narrowest unsigned integer which holds the largest discriminant
 * of the type. The payload of the selected arm follows. Unknown discriminants are rejected with
 * `codec::unknown_variant`.
 */

#include "layout.hpp"

#include <base/type_name.hpp>
#include <codec/exceptions.hpp>
#include <codec/pod_serializable.hpp>
#include <codec/serializer.hpp>
#include <codec/stl_common.hpp>

#include <type_traits>
#include <variant>

namespace derive {

template <typename T>
concept tagged_union = requires { union_layout<T>::arms(); };

template <typename T>
concept enumeration = std::is_enum_v<T> && requires { enum_layout<T>::variants(); };

namespace impl {

template <typename T>
using arms_t = decltype(union_layout<T>::arms());

template <typename Variant, typename Arms>
struct arms_match_alternatives : std::false_type
{
};

template <typename... Ts, typename... As>
requires(sizeof...(Ts) == sizeof...(As))
struct arms_match_alternatives<std::variant<Ts...>, std::tuple<arm<As>...>>
    : std::bool_constant<(std::is_same_v<Ts, As> && ...)>
{
};

template <typename Variant>
struct alternatives_wire;

template <typename... Ts>
struct alternatives_wire<std::variant<Ts...>> : std::bool_constant<(codec::wire_type<Ts> && ...)>
{
};

/// Position of the entry with discriminant `d`, or the size of `entries` if there is none.
template <typename E, std::size_t N>
constexpr std::size_t find_discriminant(const std::array<E, N>& entries, uint64_t d) noexcept
{
    for (std::size_t i = 0; i < N; ++i) {
        if (entries[i].discriminant == d) {
            return i;
        }
    }
    return N;
}

} // namespace impl

/**
 * @brief Tagged unions whose every arm satisfies the codec contract.
 */
template <typename T>
concept wire_union = tagged_union<T> && impl::alternatives_wire<variant_base_t<T>>::value;

} // namespace derive

namespace codec {

template <derive::wire_union T>
struct serializable<T>
{
    using variant_t = derive::variant_base_t<T>;

    static constexpr auto discriminants = derive::arm_discriminants(derive::union_layout<T>::arms());

    static_assert(derive::impl::arms_match_alternatives<variant_t, derive::impl::arms_t<T>>::value,
                  "AP_UNION must list every alternative of the variant, in the same order");
    static_assert(derive::unique_discriminants(discriminants), "discriminants of the union arms must be unique");

    using discriminant_t = derive::discriminant_t<derive::max_discriminant(discriminants)>;

    static constexpr uint64_t min_size = sizeof(discriminant_t);

    static async::task<T> read(reader& r)
    {
        depth_guard guard(r);
        auto d = co_await codec::read<discriminant_t>(r);
        const auto index = derive::impl::find_discriminant(discriminants, d);
        if (index == discriminants.size()) {
            throw unknown_variant(d, base::type_name<T>());
        }
        co_return co_await impl::read_alternative<0, variant_t, T>(r, index);
    }

    static async::task<void> write(const T& o, writer& w)
    {
        const auto& v = static_cast<const variant_t&>(o);
        if (v.valueless_by_exception()) {
            throw custom_failure("Can't encode valueless variant");
        }
        co_await codec::write(static_cast<discriminant_t>(discriminants[v.index()].discriminant), w);
        co_await impl::write_alternative<0>(v, w);
    }
};

template <derive::enumeration T>
struct serializable<T>
{
    static constexpr auto variants = derive::enum_layout<T>::variants();

    static_assert(derive::unique_discriminants(variants), "discriminants of the enumerators must be unique");

    using discriminant_t = derive::discriminant_t<derive::max_discriminant(variants)>;

    static constexpr uint64_t min_size = sizeof(discriminant_t);

    static async::task<T> read(reader& r)
    {
        auto d = co_await codec::read<discriminant_t>(r);
        const auto index = derive::impl::find_discriminant(variants, d);
        if (index == variants.size()) {
            throw unknown_variant(d, base::type_name<T>());
        }
        co_return variants[index].value;
    }

    static async::task<void> write(const T& o, writer& w)
    {
        for (const auto& v : variants) {
            if (v.value == o) {
                co_await codec::write(static_cast<discriminant_t>(v.discriminant), w);
                co_return;
            }
        }
        using U = std::underlying_type_t<T>;
        throw unknown_variant(static_cast<uint64_t>(static_cast<U>(o)), base::type_name<T>());
    }
};

} // namespace codec
