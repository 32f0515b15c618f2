#pragma once

/**
 * @file utf8.hpp
 * @brief UTF-8 validation utilities.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace base {

/**
 * @brief Validates that the given bytes are well formed UTF-8.
 *
 * Overlong forms, surrogate code points (U+D800..U+DFFF) and code points above U+10FFFF are rejected.
 *
 * @return The offset of the first invalid byte, or `std::nullopt` if the whole sequence is valid.
 */
std::optional<std::size_t> find_invalid_utf8(std::span<const uint8_t> bytes) noexcept;

inline bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept
{
    return !find_invalid_utf8(bytes).has_value();
}

} // namespace base
