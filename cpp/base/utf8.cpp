#include "utf8.hpp"

namespace base {

namespace {

inline bool is_continuation(uint8_t b) noexcept
{
    return (b & 0xC0) == 0x80;
}

}

std::optional<std::size_t> find_invalid_utf8(std::span<const uint8_t> bytes) noexcept
{
    std::size_t i = 0;
    const auto n = bytes.size();
    while (i < n) {
        const uint8_t b = bytes[i];
        if (b < 0x80) {
            ++i;
            continue;
        }
        std::size_t length = 0;
        uint8_t lower = 0x80;
        uint8_t upper = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            length = 2;
        } else if (b >= 0xE0 && b <= 0xEF) {
            length = 3;
            if (b == 0xE0) {
                lower = 0xA0;
            } else if (b == 0xED) {
                upper = 0x9F;
            }
        } else if (b >= 0xF0 && b <= 0xF4) {
            length = 4;
            if (b == 0xF0) {
                lower = 0x90;
            } else if (b == 0xF4) {
                upper = 0x8F;
            }
        } else {
            return i;
        }
        if (n - i < length) {
            return i;
        }
        // The second byte carries the range restrictions, the rest are plain continuation bytes.
        if (bytes[i + 1] < lower || bytes[i + 1] > upper) {
            return i;
        }
        for (std::size_t k = 2; k < length; ++k) {
            if (!is_continuation(bytes[i + k])) {
                return i;
            }
        }
        i += length;
    }
    return std::nullopt;
}

} // namespace base
