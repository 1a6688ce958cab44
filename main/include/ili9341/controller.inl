namespace ili9341 {

template<interface Interface>
auto controller<Interface>::nop() -> result<> {
	return write_command(command_id::NOP);
}

template<interface Interface>
auto controller<Interface>::software_reset() -> result<> {
	return write_command(command_id::SOFT_RESET);
}


template<interface Interface>
auto controller<Interface>::read_display_identification() -> result<display_identification> {
	return read_register<display_identification>(command_id::GET_IDENTIFICATION);
}

template<interface Interface>
auto controller<Interface>::read_display_status() -> result<display_status> {
	return read_register<display_status>(command_id::GET_STATUS);
}

template<interface Interface>
auto controller<Interface>::read_display_power_mode() -> result<display_power_mode> {
	return read_register<display_power_mode>(command_id::GET_POWER_MODE);
}

template<interface Interface>
auto controller<Interface>::read_display_madctl() -> result<madctl> {
	return read_register<madctl>(command_id::GET_ADDRESS_MODE);
}

template<interface Interface>
auto controller<Interface>::read_pixel_format() -> result<pixel_format> {
	return read_register<pixel_format>(command_id::GET_PIXEL_FORMAT);
}

template<interface Interface>
auto controller<Interface>::read_image_format() -> result<image_format> {
	return read_register<image_format>(command_id::GET_IMAGE_FORMAT);
}

template<interface Interface>
auto controller<Interface>::read_signal_mode() -> result<signal_mode> {
	return read_register<signal_mode>(command_id::GET_SIGNAL_MODE);
}

template<interface Interface>
auto controller<Interface>::read_self_diagnostic_result() -> result<self_diagnostic_result> {
	return read_register<self_diagnostic_result>(command_id::GET_DIAGNOSTIC_RESULT);
}


template<interface Interface>
auto controller<Interface>::enter_sleep_mode() -> result<> {
	return write_command(command_id::ENTER_SLEEP_MODE);
}

template<interface Interface>
auto controller<Interface>::sleep_out() -> result<> {
	return write_command(command_id::EXIT_SLEEP_MODE);
}

template<interface Interface>
auto controller<Interface>::partial_mode_on() -> result<> {
	return write_command(command_id::ENTER_PARTIAL_MODE);
}

template<interface Interface>
auto controller<Interface>::normal_display_mode_on() -> result<> {
	return write_command(command_id::ENTER_NORMAL_MODE);
}


template<interface Interface>
auto controller<Interface>::display_inversion(const bool on) -> result<> {
	return write_command(on ? command_id::ENTER_INVERT_MODE : command_id::EXIT_INVERT_MODE);
}

template<interface Interface>
auto controller<Interface>::gamma_set(const uint8_t gc) -> result<> {
	const std::array parameters{ gc };
	return write_parameters(command_id::SET_GAMMA_CURVE, parameters);
}

template<interface Interface>
auto controller<Interface>::display(const bool on) -> result<> {
	return write_command(on ? command_id::ENABLE_DISPLAY : command_id::DISABLE_DISPLAY);
}


template<interface Interface>
auto controller<Interface>::column_address_set(const uint16_t sc, const uint16_t ec) -> result<> {
	return write_words(command_id::SET_COLUMN_ADDRESS, sc, ec);
}

template<interface Interface>
auto controller<Interface>::page_address_set(const uint16_t sp, const uint16_t ep) -> result<> {
	return write_words(command_id::SET_PAGE_ADDRESS, sp, ep);
}


template<interface Interface>
auto controller<Interface>::memory_write_start() -> result<> {
	return write_command(command_id::WRITE_MEMORY_START);
}

template<interface Interface>
auto controller<Interface>::color_set(
	const std::span<const uint8_t, color_lookup_table_size> table
) -> result<> {
	return write_parameters(command_id::SET_COLOR_LOOKUP_TABLE, table);
}

template<interface Interface>
auto controller<Interface>::memory_read_start() -> result<> {
	return write_command(command_id::READ_MEMORY_START);
}


template<interface Interface>
auto controller<Interface>::partial_area(const uint16_t sr, const uint16_t er) -> result<> {
	return write_words(command_id::SET_PARTIAL_AREA, sr, er);
}

template<interface Interface>
auto controller<Interface>::vertical_scrolling_definition(
	const uint16_t tfa, const uint16_t vsa, const uint16_t bfa
) -> result<> {
	return write_words(command_id::SET_SCROLL_AREA, tfa, vsa, bfa);
}

/**
 * 0x34 takes no parameter while 0x35 carries the M bit, so the three states
 * cannot be encoded as one command with a mode byte.
 */
template<interface Interface>
auto controller<Interface>::tearing_effect(const ili9341::tearing_effect mode) -> result<> {
	switch (mode) {
		case ili9341::tearing_effect::vblank_only: {
			constexpr std::array<uint8_t, 1> parameters{ 0x00 };
			return write_parameters(command_id::SET_TEAR_ON, parameters);
		}
		case ili9341::tearing_effect::h_and_vblank: {
			constexpr std::array<uint8_t, 1> parameters{ 0x01 };
			return write_parameters(command_id::SET_TEAR_ON, parameters);
		}
		case ili9341::tearing_effect::off:
		default: break;
	}
	return write_command(command_id::SET_TEAR_OFF);
}

template<interface Interface>
auto controller<Interface>::memory_access_control(
	const ili9341::memory_access_control value
) -> result<> {
	return write_parameters(command_id::SET_MEMORY_ACCESS, value.bytes());
}

template<interface Interface>
auto controller<Interface>::vertical_scrolling_start_address(const uint16_t vsp) -> result<> {
	return write_words(command_id::SET_SCROLL_START, vsp);
}

template<interface Interface>
auto controller<Interface>::idle_mode(const bool on) -> result<> {
	return write_command(on ? command_id::ENTER_IDLE_MODE : command_id::EXIT_IDLE_MODE);
}

template<interface Interface>
auto controller<Interface>::pixel_format_set(const pixel_format value) -> result<> {
	return write_parameters(command_id::SET_PIXEL_FORMAT, value.bytes());
}


template<interface Interface>
auto controller<Interface>::write_memory_continue() -> result<> {
	return write_command(command_id::WRITE_MEMORY_CONTINUE);
}

template<interface Interface>
auto controller<Interface>::read_memory_continue() -> result<> {
	return write_command(command_id::READ_MEMORY_CONTINUE);
}

template<interface Interface>
template<std::ranges::input_range Words>
	requires std::convertible_to<std::ranges::range_reference_t<Words>, uint32_t>
		&& requires(Interface &bus, Words &&words) { bus.write_memory(std::forward<Words>(words)); }
auto controller<Interface>::write_memory(Words &&words) -> result<> {
	return m_interface.write_memory(std::forward<Words>(words));
}

template<interface Interface>
auto controller<Interface>::read_memory(const std::span<uint32_t> words) -> result<> {
	return m_interface.read_memory(words);
}


template<interface Interface>
auto controller<Interface>::set_tear_scanline(const uint16_t sts) -> result<> {
	return write_words(command_id::SET_TEAR_SCANLINE, sts);
}

template<interface Interface>
auto controller<Interface>::get_scanline() -> result<uint16_t> {
	std::array<uint8_t, 2> response{};
	if (auto status{ read_parameters(command_id::GET_SCANLINE, response) }; !status) [[unlikely]] {
		return std::unexpected{ status.error() };
	}
	return static_cast<uint16_t>((uint16_t{ response[0] } << 8) | uint16_t{ response[1] });
}


template<interface Interface>
auto controller<Interface>::write_display_brightness(const uint8_t dbv) -> result<> {
	const std::array parameters{ dbv };
	return write_parameters(command_id::SET_DISPLAY_BRIGHTNESS, parameters);
}

template<interface Interface>
auto controller<Interface>::read_display_brightness() -> result<uint8_t> {
	return read_byte(command_id::GET_DISPLAY_BRIGHTNESS);
}

template<interface Interface>
auto controller<Interface>::write_ctrl_display(const ctrl_display value) -> result<> {
	return write_parameters(command_id::SET_CTRL_DISPLAY, value.bytes());
}

template<interface Interface>
auto controller<Interface>::read_ctrl_display() -> result<ctrl_display> {
	return read_register<ctrl_display>(command_id::GET_CTRL_DISPLAY);
}

template<interface Interface>
auto controller<Interface>::write_cabc(const uint8_t c) -> result<> {
	const std::array parameters{ c };
	return write_parameters(command_id::SET_CONTENT_ADAPTIVE_BRIGHTNESS_CONTROL, parameters);
}

template<interface Interface>
auto controller<Interface>::read_cabc() -> result<uint8_t> {
	return read_byte(command_id::GET_CONTENT_ADAPTIVE_BRIGHTNESS_CONTROL);
}

template<interface Interface>
auto controller<Interface>::write_cabc_minimum_brightness(const uint8_t cmb) -> result<> {
	const std::array parameters{ cmb };
	return write_parameters(command_id::SET_CABC_MINIMUM_BRIGHTNESS, parameters);
}

template<interface Interface>
auto controller<Interface>::read_cabc_minimum_brightness() -> result<uint8_t> {
	return read_byte(command_id::GET_CABC_MINIMUM_BRIGHTNESS);
}


template<interface Interface>
auto controller<Interface>::read_id1() -> result<uint8_t> {
	return read_byte(command_id::GET_ID1);
}

template<interface Interface>
auto controller<Interface>::read_id2() -> result<uint8_t> {
	return read_byte(command_id::GET_ID2);
}

template<interface Interface>
auto controller<Interface>::read_id3() -> result<uint8_t> {
	return read_byte(command_id::GET_ID3);
}


template<interface Interface>
[[gnu::always_inline]]
inline auto controller<Interface>::write_command(const command_id id) -> result<> {
	return write_parameters(id, {});
}

template<interface Interface>
[[gnu::always_inline]]
inline auto controller<Interface>::write_parameters(
	const command_id id,
	const std::span<const uint8_t> parameters
) -> result<> {
	return m_interface.write_parameters(std::to_underlying(id), parameters);
}

template<interface Interface>
[[gnu::always_inline]]
inline auto controller<Interface>::read_parameters(
	const command_id id,
	const std::span<uint8_t> response
) -> result<> {
	return m_interface.read_parameters(std::to_underlying(id), response);
}

template<interface Interface>
template<std::same_as<uint16_t> ...Values>
auto controller<Interface>::write_words(const command_id id, const Values ...values) -> result<> {
	std::array<uint8_t, sizeof...(Values) * 2u> parameters{};
	size_t offset{};
	((
		parameters[offset++] = static_cast<uint8_t>(values >> 8),
		parameters[offset++] = static_cast<uint8_t>(values & 0xFFu)
	), ...);
	return write_parameters(id, parameters);
}

template<interface Interface>
template<class Register>
auto controller<Interface>::read_register(const command_id id) -> result<Register> {
	auto value{ Register::zeroed() };
	if (auto status{ read_parameters(id, value.bytes()) }; !status) [[unlikely]] {
		return std::unexpected{ status.error() };
	}
	return value;
}

template<interface Interface>
auto controller<Interface>::read_byte(const command_id id) -> result<uint8_t> {
	std::array<uint8_t, 1> response{};
	if (auto status{ read_parameters(id, response) }; !status) [[unlikely]] {
		return std::unexpected{ status.error() };
	}
	return response[0];
}

} // namespace ili9341
