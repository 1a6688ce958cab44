#pragma once

#include <cstdint>

namespace ili9341 {

/// State of the TE output line.
enum class tearing_effect : uint8_t {
	off,          ///< TE line disabled (0x34)
	vblank_only,  ///< pulse on V-blank (0x35, M = 0)
	h_and_vblank, ///< pulse on both H-blank and V-blank (0x35, M = 1)
};

} // namespace ili9341
