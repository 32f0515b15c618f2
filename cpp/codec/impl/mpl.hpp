#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace codec::impl {

template <typename T>
struct has_construct_member_function
{

    template <typename U>
    static int check(decltype(&U::construct)*);

    template <typename U>
    static char check(...);

    static bool constexpr value = (sizeof(check<T>(nullptr)) == sizeof(int));
};

template <typename T>
constexpr bool has_construct_member_function_v = has_construct_member_function<T>::value;

template <typename T>
struct has_min_size_member
{

    template <typename U>
    static int check(decltype(&U::min_size)*);

    template <typename U>
    static char check(...);

    static bool constexpr value = (sizeof(check<T>(nullptr)) == sizeof(int));
};

template <typename T>
constexpr bool has_min_size_member_v = has_min_size_member<T>::value;

/// Sum of the two sizes, saturated at the maximum of `uint64_t`.
constexpr uint64_t saturating_add(uint64_t a, uint64_t b) noexcept
{
    return a > UINT64_MAX - b ? UINT64_MAX : a + b;
}

constexpr uint64_t saturating_mul(uint64_t a, uint64_t b) noexcept
{
    return (b != 0 && a > UINT64_MAX / b) ? UINT64_MAX : a * b;
}

template <typename T>
constexpr bool is_byte_v = std::is_same_v<T, uint8_t> || std::is_same_v<T, int8_t> || std::is_same_v<T, char> ||
                           std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char> ||
                           std::is_same_v<T, std::byte>;

} // namespace codec::impl
