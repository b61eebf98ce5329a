#pragma once

#include <cstdint>
#include <string>

#include "io/image_types.hpp"

namespace gifdraw {

// Canonical color text used in draw commands: "#RRGGBB", uppercase.
// Alpha is not part of the color.
std::string to_hex(uint8_t r, uint8_t g, uint8_t b);
std::string to_hex(const Rgba& px);

} // namespace gifdraw
