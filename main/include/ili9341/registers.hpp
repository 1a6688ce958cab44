#pragma once

#include <span>
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace ili9341 {

/**
 * @brief Raw register content as clocked out of (or into) the controller.
 *
 * The length is fixed by the register and never changes. Bit fields are not
 * interpreted here.
 * @tparam Tag  Distinguishes registers of the same length.
 * @tparam Size Response length in bytes.
 */
template<class Tag, size_t Size>
struct register_value {
	static constexpr size_t size{ Size };

	std::array<uint8_t, Size> raw{};

	[[nodiscard]]
	static constexpr auto zeroed() noexcept -> register_value { return register_value{}; }

	[[nodiscard]]
	static constexpr auto from_raw(const uint8_t value) noexcept -> register_value
		requires (Size == 1) {
		return register_value{ .raw{ value } };
	}

	[[nodiscard]]
	constexpr auto bytes() const noexcept -> std::span<const uint8_t, Size> { return raw; }

	[[nodiscard]]
	constexpr auto bytes() noexcept -> std::span<uint8_t, Size> { return raw; }

	constexpr auto operator==(const register_value &) const noexcept -> bool = default;
};

namespace tags {

struct display_identification;
struct display_status;
struct display_power_mode;
struct madctl;
struct memory_access_control;
struct pixel_format;
struct image_format;
struct signal_mode;
struct self_diagnostic_result;
struct ctrl_display;

} // namespace tags

using display_identification = register_value<tags::display_identification, 3>; // 0x04
using display_status         = register_value<tags::display_status,         4>; // 0x09
using display_power_mode     = register_value<tags::display_power_mode,     1>; // 0x0A
using madctl                 = register_value<tags::madctl,                 1>; // 0x0B
using memory_access_control  = register_value<tags::memory_access_control,  1>; // 0x36
using pixel_format           = register_value<tags::pixel_format,           1>; // 0x0C / 0x3A
using image_format           = register_value<tags::image_format,           1>; // 0x0D
using signal_mode            = register_value<tags::signal_mode,            1>; // 0x0E
using self_diagnostic_result = register_value<tags::self_diagnostic_result, 1>; // 0x0F
using ctrl_display           = register_value<tags::ctrl_display,           1>; // 0x53 / 0x54

inline constexpr size_t color_lookup_table_size{ 128u };

/// Payload of Color Set (0x2D): 32 red, 64 green and 32 blue entries.
using color_lookup_table = std::array<uint8_t, color_lookup_table_size>;


enum class orientation : uint8_t {
	portrait,
	landscape,
	inverted_portrait,
	inverted_landscape,
};

/// Values of the Pixel Format Set parameter (RGB interface and MCU interface).
enum class pixel_format_value : uint8_t {
	R5G6B5 = 0x55,
	R6G6B6 = 0x66,
};

[[nodiscard]]
constexpr auto make_memory_access_control(
	const orientation value,
	const bool bgr = true
) noexcept -> memory_access_control {
	enum memory_access : uint8_t {
		row_address_order        = 0x80, // MY
		column_address_order     = 0x40, // MX
		swap_row_column          = 0x20, // MV
		vertical_refresh_order   = 0x10, // ML
		bgr_color_order          = 0x08, // BGR
		horizontal_refresh_order = 0x04, // MH
	};

	uint8_t bits{ bgr ? uint8_t{ bgr_color_order } : uint8_t{} };
	switch (value) {
		case orientation::portrait:           bits |= column_address_order; break;
		case orientation::landscape:          bits |= swap_row_column;      break;
		case orientation::inverted_portrait:  bits |= row_address_order;    break;
		case orientation::inverted_landscape:
			bits |= row_address_order | column_address_order | swap_row_column;
			break;

		default: break;
	}
	return memory_access_control::from_raw(bits);
}

[[nodiscard]]
constexpr auto make_pixel_format(const pixel_format_value value) noexcept -> pixel_format {
	return pixel_format::from_raw(std::to_underlying(value));
}

} // namespace ili9341
