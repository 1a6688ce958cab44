#pragma once

#if __has_include("ili9341-user-config.hpp")
#include "ili9341-user-config.hpp"
#endif // __has_include("ili9341-user-config.hpp")

// Panel resolution in portrait orientation
#if !defined(ILI9341_WIDTH)
#define ILI9341_WIDTH 240
#endif // !defined(ILI9341_WIDTH)

#if !defined(ILI9341_HEIGHT)
#define ILI9341_HEIGHT 320
#endif // !defined(ILI9341_HEIGHT)

// Transport used by the firmware: define exactly one of them
#if !defined(ILI9341_BUS_SPI) && !defined(ILI9341_BUS_I80)
#define ILI9341_BUS_SPI
#endif

#if defined(ILI9341_BUS_SPI) && defined(ILI9341_BUS_I80)
#error "ILI9341_BUS_SPI and ILI9341_BUS_I80 are mutually exclusive"
#endif

// Controlling pins
#if !defined(ILI9341_PIN_RESET)
#define ILI9341_PIN_RESET 9
#endif
#if !defined(ILI9341_PIN_CS)
#define ILI9341_PIN_CS 10
#endif
#if !defined(ILI9341_PIN_DC)
#define ILI9341_PIN_DC 11 // Data/Command (RS). HIGH == data, LOW == command
#endif

// SPI
#if !defined(ILI9341_SPI_HOST)
#define ILI9341_SPI_HOST SPI2_HOST
#endif
#if !defined(ILI9341_SPI_CLOCK_HZ)
#define ILI9341_SPI_CLOCK_HZ 10000000
#endif
#if !defined(ILI9341_PIN_SCLK)
#define ILI9341_PIN_SCLK 12
#endif
#if !defined(ILI9341_PIN_MOSI)
#define ILI9341_PIN_MOSI 13
#endif
#if !defined(ILI9341_PIN_MISO)
#define ILI9341_PIN_MISO 14
#endif

// 8-bit parallel
#if !defined(ILI9341_PIN_WRITE)
#define ILI9341_PIN_WRITE 12
#endif
#if !defined(ILI9341_PIN_READ)
#define ILI9341_PIN_READ 13
#endif
#if !defined(ILI9341_PIN_DATA)
#define ILI9341_PIN_DATA 17, 18, 4, 5, 6, 7, 15, 16 // D0..D7
#endif
