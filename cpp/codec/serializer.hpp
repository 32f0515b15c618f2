#pragma once

#include "context.hpp"
#include "impl/mpl.hpp"
#include "serializable.hpp"

#include <async/task.hpp>

#include <concepts>
#include <cstdint>

namespace codec {

/**
 * @brief The types which implement the codec contract.
 */
template <typename T>
concept wire_type = requires(reader& r, writer& w, const T& o) {
    { serializable<T>::read(r) } -> std::same_as<async::task<T>>;
    { serializable<T>::write(o, w) } -> std::same_as<async::task<void>>;
};

/**
 * @brief Length prefixed types, which can reject the length field above the given limit.
 */
template <typename T>
concept length_limited = wire_type<T> && requires(reader& r, uint64_t limit, const T& o) {
    { serializable<T>::read_limited(r, limit) } -> std::same_as<async::task<T>>;
    { serializable<T>::length(o) } -> std::convertible_to<uint64_t>;
};

template <typename T>
struct serializer
{
    static_assert(sizeof(serializable<T>) > 0,
                  "the specialization serializable<T> must be included in places where serializer.hpp is used");

    /**
     * @brief Lower bound of the encoded size of `T`.
     */
    static constexpr uint64_t min_size = [] {
        if constexpr (impl::has_min_size_member_v<serializable<T>>) {
            return static_cast<uint64_t>(serializable<T>::min_size);
        } else {
            return uint64_t(0);
        }
    }();

    /**
     * @brief Constructs empty object for read.
     *
     * @return T The constructed object.
     */
    inline static T construct()
    {
        if constexpr (impl::has_construct_member_function_v<serializable<T>>) {
            return serializable<T>::construct();
        } else {
            return T();
        }
    }

    inline static async::task<T> read(reader& r)
    {
        return serializable<T>::read(r);
    }

    inline static async::task<void> write(const T& o, writer& w)
    {
        return serializable<T>::write(o, w);
    }
};

template <typename T>
inline constexpr uint64_t min_size_v = serializer<T>::min_size;

/**
 * @brief Reads `T` inside of an ongoing decode.
 */
template <typename T>
inline async::task<T> read(reader& r)
{
    return serializer<T>::read(r);
}

/**
 * @brief Writes `o` inside of an ongoing encode. The object must outlive the returned task.
 */
template <typename T>
inline async::task<void> write(const T& o, writer& w)
{
    return serializer<T>::write(o, w);
}

} // namespace codec
