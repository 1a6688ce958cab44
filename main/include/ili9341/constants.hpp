#pragma once

#include <cstddef>
#include <cstdint>

#include "ili9341/config.hpp"

namespace ili9341::constants {

inline constexpr uint16_t WIDTH { ILI9341_WIDTH  };
inline constexpr uint16_t HEIGHT{ ILI9341_HEIGHT };
inline constexpr size_t   PIXELS_COUNT{ static_cast<size_t>(WIDTH) * HEIGHT };

} // namespace ili9341::constants
