#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace codec {

using buffer_t = std::vector<uint8_t>;
using buffer_view_t = std::span<const uint8_t>;

}
