#pragma once

/**
 * @file result.hpp
 * @brief Definition of the `result` class, the success-or-failure value of the wire format.
 */

#include <utility>
#include <variant>

namespace codec {

/**
 * @brief Holds either the success value `T` or the failure value `E`.
 * On the wire the success arm has discriminant 0 and the failure arm 1.
 */
template <typename T, typename E>
class result
{
public:
    static result success(T value)
    {
        return result(std::in_place_index<0>, std::move(value));
    }

    static result failure(E error)
    {
        return result(std::in_place_index<1>, std::move(error));
    }

    bool has_value() const noexcept
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    /// @throws std::bad_variant_access If the result holds failure.
    const T& value() const
    {
        return std::get<0>(storage_);
    }

    T& value()
    {
        return std::get<0>(storage_);
    }

    /// @throws std::bad_variant_access If the result holds success.
    const E& error() const
    {
        return std::get<1>(storage_);
    }

    E& error()
    {
        return std::get<1>(storage_);
    }

    bool operator==(const result&) const = default;

private:
    template <std::size_t index, typename V>
    result(std::in_place_index_t<index> i, V&& v)
        : storage_(i, std::forward<V>(v))
    {
    }

private:
    std::variant<T, E> storage_;
};

} // namespace codec
