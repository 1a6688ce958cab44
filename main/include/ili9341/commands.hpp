#pragma once

#include <cstdint>

namespace ili9341 {

enum class command_id : uint8_t {
	NOP                                     = 0x00,
	SOFT_RESET                              = 0x01,
	GET_IDENTIFICATION                      = 0x04,
	GET_STATUS                              = 0x09,
	GET_POWER_MODE                          = 0x0A,
	GET_ADDRESS_MODE                        = 0x0B,
	GET_PIXEL_FORMAT                        = 0x0C,
	GET_IMAGE_FORMAT                        = 0x0D,
	GET_SIGNAL_MODE                         = 0x0E,
	GET_DIAGNOSTIC_RESULT                   = 0x0F,
	ENTER_SLEEP_MODE                        = 0x10,
	EXIT_SLEEP_MODE                         = 0x11,
	ENTER_PARTIAL_MODE                      = 0x12,
	ENTER_NORMAL_MODE                       = 0x13,
	EXIT_INVERT_MODE                        = 0x20,
	ENTER_INVERT_MODE                       = 0x21,
	SET_GAMMA_CURVE                         = 0x26,
	DISABLE_DISPLAY                         = 0x28,
	ENABLE_DISPLAY                          = 0x29,
	SET_COLUMN_ADDRESS                      = 0x2A,
	SET_PAGE_ADDRESS                        = 0x2B,
	WRITE_MEMORY_START                      = 0x2C,
	SET_COLOR_LOOKUP_TABLE                  = 0x2D,
	READ_MEMORY_START                       = 0x2E,
	SET_PARTIAL_AREA                        = 0x30,
	SET_SCROLL_AREA                         = 0x33,
	SET_TEAR_OFF                            = 0x34,
	SET_TEAR_ON                             = 0x35,
	SET_MEMORY_ACCESS                       = 0x36,
	SET_SCROLL_START                        = 0x37,
	EXIT_IDLE_MODE                          = 0x38,
	ENTER_IDLE_MODE                         = 0x39,
	SET_PIXEL_FORMAT                        = 0x3A,
	WRITE_MEMORY_CONTINUE                   = 0x3C,
	READ_MEMORY_CONTINUE                    = 0x3E,
	SET_TEAR_SCANLINE                       = 0x44,
	GET_SCANLINE                            = 0x45,
	SET_DISPLAY_BRIGHTNESS                  = 0x51,
	GET_DISPLAY_BRIGHTNESS                  = 0x52,
	SET_CTRL_DISPLAY                        = 0x53,
	GET_CTRL_DISPLAY                        = 0x54,
	SET_CONTENT_ADAPTIVE_BRIGHTNESS_CONTROL = 0x55,
	GET_CONTENT_ADAPTIVE_BRIGHTNESS_CONTROL = 0x56,
	SET_CABC_MINIMUM_BRIGHTNESS             = 0x5E,
	GET_CABC_MINIMUM_BRIGHTNESS             = 0x5F,
	GET_ID1                                 = 0xDA,
	GET_ID2                                 = 0xDB,
	GET_ID3                                 = 0xDC,
};

} // namespace ili9341
