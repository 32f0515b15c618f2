#pragma once

/**
 * @file record.hpp
 * @brief Generated wire format of the records: the fields in declaration order, without names or tags.
 */

#include "layout.hpp"

#include <codec/exceptions.hpp>
#include <codec/serializer.hpp>

#include <tuple>
#include <type_traits>

namespace derive {

template <typename T>
concept record = requires { record_layout<T>::fields(); };

namespace impl {

template <typename F>
struct field_is_wire : std::false_type
{
};

template <typename C, typename M>
struct field_is_wire<field<C, M>> : std::bool_constant<codec::wire_type<M>>
{
};

template <typename C, typename M>
struct field_is_wire<limited_field<C, M>> : std::bool_constant<codec::length_limited<M>>
{
};

template <typename C, typename M>
struct field_is_wire<skipped_field<C, M>> : std::bool_constant<std::is_default_constructible_v<M>>
{
};

template <typename Fields>
struct all_fields_wire;

template <typename... Fs>
struct all_fields_wire<std::tuple<Fs...>> : std::bool_constant<(field_is_wire<Fs>::value && ...)>
{
};

template <typename F>
struct field_min_size
{
    static constexpr uint64_t value = codec::min_size_v<typename F::member_type>;
};

template <typename C, typename M>
struct field_min_size<skipped_field<C, M>>
{
    static constexpr uint64_t value = 0;
};

template <typename T>
using fields_t = decltype(record_layout<T>::fields());

template <typename Class, typename Member, typename T>
async::task<void> read_field(codec::reader& r, T& result, field<Class, Member> f)
{
    try {
        auto value = co_await codec::read<Member>(r);
        result.*(f.pointer) = std::move(value);
    } catch (base::exception& e) {
        e.add_context(f.name);
        throw;
    }
}

template <typename Class, typename Member, typename T>
async::task<void> read_field(codec::reader& r, T& result, limited_field<Class, Member> f)
{
    try {
        auto value = co_await codec::serializable<Member>::read_limited(r, f.max_length);
        result.*(f.pointer) = std::move(value);
    } catch (base::exception& e) {
        e.add_context(f.name);
        throw;
    }
}

template <typename Class, typename Member, typename T>
async::task<void> read_field(codec::reader&, T&, skipped_field<Class, Member>)
{
    co_return;
}

template <typename Class, typename Member, typename T>
async::task<void> write_field(const T& o, codec::writer& w, field<Class, Member> f)
{
    try {
        co_await codec::write<Member>(o.*(f.pointer), w);
    } catch (base::exception& e) {
        e.add_context(f.name);
        throw;
    }
}

template <typename Class, typename Member, typename T>
async::task<void> write_field(const T& o, codec::writer& w, limited_field<Class, Member> f)
{
    const auto& member = o.*(f.pointer);
    try {
        const auto length = static_cast<uint64_t>(codec::serializable<Member>::length(member));
        if (length > f.max_length) {
            throw codec::length_limit_exceeded(length, f.max_length);
        }
        co_await codec::write<Member>(member, w);
    } catch (base::exception& e) {
        e.add_context(f.name);
        throw;
    }
}

template <typename Class, typename Member, typename T>
async::task<void> write_field(const T&, codec::writer&, skipped_field<Class, Member>)
{
    co_return;
}

template <std::size_t index, typename T>
async::task<void> read_fields(codec::reader& r, T& result)
{
    if constexpr (index < std::tuple_size_v<fields_t<T>>) {
        co_await read_field(r, result, std::get<index>(record_layout<T>::fields()));
        co_await read_fields<index + 1>(r, result);
    }
    co_return;
}

template <std::size_t index, typename T>
async::task<void> write_fields(const T& o, codec::writer& w)
{
    if constexpr (index < std::tuple_size_v<fields_t<T>>) {
        co_await write_field(o, w, std::get<index>(record_layout<T>::fields()));
        co_await write_fields<index + 1>(o, w);
    }
    co_return;
}

template <typename Fields>
struct record_min_size;

template <typename... Fs>
struct record_min_size<std::tuple<Fs...>>
{
    static constexpr uint64_t value = [] {
        uint64_t size = 0;
        ((size = codec::impl::saturating_add(size, field_min_size<Fs>::value)), ...);
        return size;
    }();
};

} // namespace impl

/**
 * @brief Records whose every field satisfies the codec contract.
 */
template <typename T>
concept wire_record = record<T> && impl::all_fields_wire<impl::fields_t<T>>::value;

} // namespace derive

namespace codec {

template <derive::wire_record T>
struct serializable<T>
{
    static constexpr uint64_t min_size = derive::impl::record_min_size<derive::impl::fields_t<T>>::value;

    static async::task<T> read(reader& r)
    {
        depth_guard guard(r);
        auto result = T();
        co_await derive::impl::read_fields<0>(r, result);
        co_return result;
    }

    inline static async::task<void> write(const T& o, writer& w)
    {
        return derive::impl::write_fields<0>(o, w);
    }
};

} // namespace codec
