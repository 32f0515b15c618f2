#pragma once

/**
 * @file derive.hpp
 * @brief Macros which derive the codec contract for the user types.
 */

/**
 * @defgroup derive
 * @{
 * @brief Compile-time derivation of the wire format of the records, tagged unions and enumerations.
 *
 * The macros must be used in the global namespace, after the definition of the type:
 * ```
 * struct point { int32_t x; int32_t y; std::string cache; };
 * AP_RECORD(point, AP_FIELD(x), AP_FIELD(y), AP_SKIP(cache))
 *
 * enum class color { red, green, blue };
 * AP_ENUM(color, AP_ENUMERATOR(red), AP_ENUMERATOR(green), AP_ENUMERATOR_AT(blue, 9))
 *
 * struct shape : std::variant<circle, square> { using variant::variant; };
 * AP_UNION(shape, AP_ARM(circle), AP_ARM_AT(square, 7))
 *
 * template <typename T> struct tagged { std::string tag; T value; };
 * AP_RECORD_TEMPLATE((typename T), (tagged<T>), AP_FIELD(tag), AP_FIELD(value))
 * ```
 * Fields and arms are written in the listed order. A self containing record must hold itself through
 * `std::unique_ptr`.
 *
 * @}
 */

#include "adapters.hpp"
#include "layout.hpp"
#include "record.hpp"
#include "tagged_union.hpp"

#include <codec/codec.hpp>

#define AP_UNPAREN(...) __VA_ARGS__

#define AP_FIELD(name) ::derive::make_field(&self_t::name, #name)
#define AP_SKIP(name) ::derive::make_skipped_field(&self_t::name, #name)
#define AP_FIELD_MAX_LEN(name, max_length) ::derive::make_limited_field(&self_t::name, #name, max_length)

#define AP_RECORD(type, ...)                                                                                           \
    template <>                                                                                                        \
    struct derive::record_layout<type>                                                                                 \
    {                                                                                                                  \
        using self_t = type;                                                                                           \
        static constexpr auto fields()                                                                                 \
        {                                                                                                              \
            return std::make_tuple(__VA_ARGS__);                                                                       \
        }                                                                                                              \
    };

/// `params` and `type` are parenthesized: `AP_RECORD_TEMPLATE((typename K, typename V), (entry<K, V>), ...)`.
#define AP_RECORD_TEMPLATE(params, type, ...)                                                                          \
    template <AP_UNPAREN params>                                                                                       \
    struct derive::record_layout<AP_UNPAREN type>                                                                      \
    {                                                                                                                  \
        using self_t = AP_UNPAREN type;                                                                                \
        static constexpr auto fields()                                                                                 \
        {                                                                                                              \
            return std::make_tuple(__VA_ARGS__);                                                                       \
        }                                                                                                              \
    };

#define AP_ENUMERATOR(name) ::derive::enumerator<self_t>{self_t::name, #name}
#define AP_ENUMERATOR_AT(name, discriminant) ::derive::enumerator<self_t>{self_t::name, #name, discriminant}

#define AP_ENUM(type, ...)                                                                                             \
    template <>                                                                                                        \
    struct derive::enum_layout<type>                                                                                   \
    {                                                                                                                  \
        using self_t = type;                                                                                           \
        static constexpr auto variants()                                                                               \
        {                                                                                                              \
            return ::derive::make_enumerators<self_t>(__VA_ARGS__);                                                    \
        }                                                                                                              \
    };

#define AP_ARM(type) ::derive::arm<type>{}
#define AP_ARM_AT(type, discriminant) ::derive::arm<type>{discriminant}

#define AP_UNION(type, ...)                                                                                            \
    template <>                                                                                                        \
    struct derive::union_layout<type>                                                                                  \
    {                                                                                                                  \
        static constexpr auto arms()                                                                                   \
        {                                                                                                              \
            return std::make_tuple(__VA_ARGS__);                                                                       \
        }                                                                                                              \
    };

#define AP_UNION_TEMPLATE(params, type, ...)                                                                           \
    template <AP_UNPAREN params>                                                                                       \
    struct derive::union_layout<AP_UNPAREN type>                                                                       \
    {                                                                                                                  \
        static constexpr auto arms()                                                                                   \
        {                                                                                                              \
            return std::make_tuple(__VA_ARGS__);                                                                       \
        }                                                                                                              \
    };

/// `type` is encoded as `proxy`, converting with `static_cast` in both directions.
#define AP_VIA(type, proxy)                                                                                            \
    template <>                                                                                                        \
    struct derive::via_layout<type>                                                                                    \
    {                                                                                                                  \
        using proxy_type = proxy;                                                                                      \
    };

/// `type` is encoded as text, `to` converts the value to the string and `from` parses it back.
#define AP_AS_STRING(type, to, from)                                                                                   \
    template <>                                                                                                        \
    struct derive::string_layout<type>                                                                                 \
    {                                                                                                                  \
        static std::string to_string(const type& o)                                                                    \
        {                                                                                                              \
            return to(o);                                                                                              \
        }                                                                                                              \
        static type from_string(const std::string& s)                                                                  \
        {                                                                                                              \
            return from(s);                                                                                            \
        }                                                                                                              \
    };

/// `type` is an enum flag set, encoded as its underlying integer. Undeclared bits are dropped on read.
#define AP_BITFLAGS(type, ...)                                                                                         \
    template <>                                                                                                        \
    struct derive::bitflags_layout<type>                                                                               \
    {                                                                                                                  \
        static constexpr auto mask = ::derive::make_mask<type>({__VA_ARGS__});                                         \
    };
