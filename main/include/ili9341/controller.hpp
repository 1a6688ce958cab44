#pragma once

#include <span>
#include <array>
#include <ranges>
#include <cstdint>
#include <utility>
#include <type_traits>
#include <concepts>

#include "ili9341/commands.hpp"
#include "ili9341/interface.hpp"
#include "ili9341/registers.hpp"
#include "ili9341/tearing_effect.hpp"

namespace ili9341 {

/**
 * @brief Level 1 command set of the ILI9341 on top of an @ref interface.
 *
 * Each method turns into exactly one transaction on the interface, in the
 * order the methods are called. Nothing about the panel is cached: sleep,
 * idle, partial, inversion and tearing state live in the panel only.
 * Parameters are not validated, and interface failures come back untouched.
 *
 * Copying a controller copies the interface. With a handle-like interface
 * (fixed pins) both copies drive the same bus without any synchronization.
 */
template<interface Interface>
class controller {
public:
	using interface_type = Interface;
	using error_type     = typename Interface::error_type;

	template<class Value = void>
	using result = ili9341::result<Value, Interface>;

	explicit controller(Interface iface) noexcept(std::is_nothrow_move_constructible_v<Interface>)
		: m_interface{ std::move(iface) } {}

	[[nodiscard]] auto bus() noexcept -> Interface & { return m_interface; }
	[[nodiscard]] auto bus() const noexcept -> const Interface & { return m_interface; }

	auto nop() -> result<>;
	auto software_reset() -> result<>;

	[[nodiscard]] auto read_display_identification() -> result<display_identification>;
	[[nodiscard]] auto read_display_status() -> result<display_status>;
	[[nodiscard]] auto read_display_power_mode() -> result<display_power_mode>;
	[[nodiscard]] auto read_display_madctl() -> result<madctl>;
	[[nodiscard]] auto read_pixel_format() -> result<pixel_format>;
	[[nodiscard]] auto read_image_format() -> result<image_format>;
	[[nodiscard]] auto read_signal_mode() -> result<signal_mode>;
	[[nodiscard]] auto read_self_diagnostic_result() -> result<self_diagnostic_result>;

	auto enter_sleep_mode() -> result<>;
	auto sleep_out() -> result<>;
	auto partial_mode_on() -> result<>;
	auto normal_display_mode_on() -> result<>;

	auto display_inversion(const bool on) -> result<>;
	auto gamma_set(const uint8_t gc) -> result<>;
	auto display(const bool on) -> result<>;

	auto column_address_set(const uint16_t sc, const uint16_t ec) -> result<>;
	auto page_address_set(const uint16_t sp, const uint16_t ep) -> result<>;

	auto memory_write_start() -> result<>;
	auto color_set(const std::span<const uint8_t, color_lookup_table_size> table) -> result<>;
	auto memory_read_start() -> result<>;

	auto partial_area(const uint16_t sr, const uint16_t er) -> result<>;
	auto vertical_scrolling_definition(const uint16_t tfa, const uint16_t vsa, const uint16_t bfa) -> result<>;
	auto tearing_effect(const ili9341::tearing_effect mode) -> result<>;
	auto memory_access_control(const ili9341::memory_access_control value) -> result<>;
	auto vertical_scrolling_start_address(const uint16_t vsp) -> result<>;
	auto idle_mode(const bool on) -> result<>;
	auto pixel_format_set(const pixel_format value) -> result<>;

	auto write_memory_continue() -> result<>;
	auto read_memory_continue() -> result<>;

	/**
	 * @brief Streams pixel words straight to the interface.
	 *
	 * No command is sent: call @ref memory_write_start or
	 * @ref write_memory_continue first. The range is consumed once and is
	 * never copied, so a lazy view keeps the memory footprint constant.
	 */
	template<std::ranges::input_range Words>
		requires std::convertible_to<std::ranges::range_reference_t<Words>, uint32_t>
			&& requires(Interface &bus, Words &&words) { bus.write_memory(std::forward<Words>(words)); }
	auto write_memory(Words &&words) -> result<>;

	/// Counterpart of @ref write_memory, after @ref memory_read_start or @ref read_memory_continue.
	auto read_memory(const std::span<uint32_t> words) -> result<>;

	auto set_tear_scanline(const uint16_t sts) -> result<>;
	[[nodiscard]] auto get_scanline() -> result<uint16_t>;

	auto write_display_brightness(const uint8_t dbv) -> result<>;
	[[nodiscard]] auto read_display_brightness() -> result<uint8_t>;

	auto write_ctrl_display(const ctrl_display value) -> result<>;
	[[nodiscard]] auto read_ctrl_display() -> result<ctrl_display>;

	auto write_cabc(const uint8_t c) -> result<>;
	[[nodiscard]] auto read_cabc() -> result<uint8_t>;

	auto write_cabc_minimum_brightness(const uint8_t cmb) -> result<>;
	[[nodiscard]] auto read_cabc_minimum_brightness() -> result<uint8_t>;

	[[nodiscard]] auto read_id1() -> result<uint8_t>;
	[[nodiscard]] auto read_id2() -> result<uint8_t>;
	[[nodiscard]] auto read_id3() -> result<uint8_t>;

private:
	Interface m_interface;

	auto write_command(const command_id id) -> result<>;
	auto write_parameters(const command_id id, const std::span<const uint8_t> parameters) -> result<>;
	auto read_parameters(const command_id id, const std::span<uint8_t> response) -> result<>;

	template<std::same_as<uint16_t> ...Values>
	auto write_words(const command_id id, const Values ...values) -> result<>;

	template<class Register>
	auto read_register(const command_id id) -> result<Register>;

	auto read_byte(const command_id id) -> result<uint8_t>;
};

} // namespace ili9341

#include "./controller.inl"
