#pragma once

/**
 * @file layout.hpp
 * @brief Compile-time descriptions of the user types, filled by the `AP_*` macros.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace derive {

/// Specialized by `AP_RECORD`: `static constexpr auto fields()` returns the tuple of field descriptors in wire order.
template <typename T>
struct record_layout;

/// Specialized by `AP_ENUM`: `static constexpr auto variants()` returns the array of `enumerator`s.
template <typename T>
struct enum_layout;

/// Specialized by `AP_UNION`: `static constexpr auto arms()` returns the tuple of `arm`s, one per alternative.
template <typename T>
struct union_layout;

/// Specialized by `AP_VIA`: `using proxy_type = ...`.
template <typename T>
struct via_layout;

/// Specialized by `AP_AS_STRING`: `static std::string to_string(const T&)` and `static T from_string(const std::string&)`.
template <typename T>
struct string_layout;

/// Specialized by `AP_BITFLAGS`: `static constexpr auto mask` holds the bits of all the declared flags.
template <typename T>
struct bitflags_layout;

inline constexpr uint64_t implicit_discriminant = std::numeric_limits<uint64_t>::max();

template <typename Class, typename Member>
struct field
{
    using member_type = Member;

    Member Class::*pointer;
    const char* name;
};

/// Field which exists only in memory. It is not written, and has its default value after the read.
template <typename Class, typename Member>
struct skipped_field
{
    using member_type = Member;

    Member Class::*pointer;
    const char* name;
};

/// Length prefixed field, with the upper limit of the length.
template <typename Class, typename Member>
struct limited_field
{
    using member_type = Member;

    Member Class::*pointer;
    const char* name;
    uint64_t max_length;
};

template <typename Class, typename Member>
constexpr field<Class, Member> make_field(Member Class::*pointer, const char* name) noexcept
{
    return {pointer, name};
}

template <typename Class, typename Member>
constexpr skipped_field<Class, Member> make_skipped_field(Member Class::*pointer, const char* name) noexcept
{
    return {pointer, name};
}

template <typename Class, typename Member>
constexpr limited_field<Class, Member> make_limited_field(Member Class::*pointer, const char* name,
                                                          uint64_t max_length) noexcept
{
    return {pointer, name, max_length};
}

template <typename T>
struct enumerator
{
    T value;
    const char* name;
    uint64_t discriminant = implicit_discriminant;
};

template <typename A>
struct arm
{
    using type = A;

    uint64_t discriminant = implicit_discriminant;
};

namespace impl {

template <typename... Ts>
std::variant<Ts...> variant_base(const std::variant<Ts...>&);

}

/// The `std::variant` the tagged union derives from.
template <typename T>
using variant_base_t = decltype(impl::variant_base(std::declval<const T&>()));

/**
 * @brief Replaces the implicit discriminants with the position of the entry.
 */
template <typename T, std::size_t N>
constexpr std::array<T, N> assign_discriminants(std::array<T, N> entries) noexcept
{
    for (std::size_t i = 0; i < N; ++i) {
        if (entries[i].discriminant == implicit_discriminant) {
            entries[i].discriminant = i;
        }
    }
    return entries;
}

template <typename T, typename... Es>
constexpr auto make_enumerators(Es... entries) noexcept
{
    return assign_discriminants(std::array<enumerator<T>, sizeof...(Es)>{entries...});
}

struct discriminant_entry
{
    uint64_t discriminant;
};

/// Discriminants of the union arms, in alternative order.
template <typename... As>
constexpr auto arm_discriminants(const std::tuple<arm<As>...>& arms) noexcept
{
    return std::apply(
        [](auto... a) {
            return assign_discriminants(
                std::array<discriminant_entry, sizeof...(As)>{discriminant_entry{a.discriminant}...});
        },
        arms);
}

template <typename T, std::size_t N>
constexpr bool unique_discriminants(const std::array<T, N>& entries) noexcept
{
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            if (entries[i].discriminant == entries[j].discriminant) {
                return false;
            }
        }
    }
    return true;
}

template <typename T, std::size_t N>
constexpr uint64_t max_discriminant(const std::array<T, N>& entries) noexcept
{
    uint64_t m = 0;
    for (const auto& e : entries) {
        m = e.discriminant > m ? e.discriminant : m;
    }
    return m;
}

/// The narrowest unsigned integer holding `max`.
template <uint64_t max>
using discriminant_t = std::conditional_t<
    (max <= std::numeric_limits<uint8_t>::max()), uint8_t,
    std::conditional_t<(max <= std::numeric_limits<uint16_t>::max()), uint16_t,
                       std::conditional_t<(max <= std::numeric_limits<uint32_t>::max()), uint32_t, uint64_t>>>;

} // namespace derive
