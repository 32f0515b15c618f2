#pragma once

namespace codec {

/**
 * @brief Template class to define the wire format of the specific type.
 * `serializable` defines the following operations for T
 * - Reader for `T` - `static async::task<T> serializable<T>::read(reader& r)`.
 *   Reads exactly the bytes of one `T` from the reader and returns the object. Any failure is reported
 *   by throwing one of the `codec` (or `stream`) exceptions. Partially read objects are never returned.
 * - Writer for `T` - `static async::task<void> serializable<T>::write(const T& o, writer& w)`.
 *   Appends the encoding of `o` to the writer.
 * - Optionally, the lower bound of the encoded size - `static constexpr uint64_t min_size`.
 *   Containers of `T` use it to verify the length field against the decode budget before allocating.
 *   The bound must never exceed the size of any valid encoding, otherwise valid input is rejected.
 * - Optionally, construction of empty `T` - `static T serializable<T>::construct()`. If it is missing,
 *   `T` is default constructed.
 * - Optionally, for length prefixed types, `static async::task<T> read_limited(reader& r, uint64_t max_length)`,
 *   which rejects length fields above `max_length`.
 *
 * The wire format is positional. Nothing but the bytes of the values themselves, the length fields
 * and the discriminants are written.
 *
 * @tparam T The type for which the serialization is defined.
 */
template <typename T>
struct serializable;

} // namespace codec
