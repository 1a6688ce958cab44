#pragma once

#include <cstdint>
#include <freertos/FreeRTOS.h>

namespace ili9341::utils {

[[gnu::always_inline]]
constexpr inline uint32_t get_bit_at(const uint32_t data, const uint32_t id) {
	return (data >> id) & 0x01u;
}

namespace literals {

consteval TickType_t operator""_ms(const unsigned long long ms) noexcept {
	return pdMS_TO_TICKS(ms);
}

} // namespace literals

} // namespace ili9341::utils
