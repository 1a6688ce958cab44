#include <esp_log.h>
#include <esp_rom_sys.h>

#include "ili9341/bus/i80.hpp"

#include "ili9341/utils.hpp"

namespace ili9341::bus {

inline constexpr auto TAG{ "[ili9341::bus::i80]" };

inline constexpr uint32_t READ_STROBE_US{ 1u };

auto i80::create(const config &cfg) -> std::expected<i80, error_type> {
	if (const auto error{ validate(cfg) }; error != ESP_OK) [[unlikely]] {
		return std::unexpected{ error };
	}
	if (const auto error{ initialize_gpio(cfg) }; error != ESP_OK) [[unlikely]] {
		return std::unexpected{ error };
	}
	return i80{ cfg };
}

i80::i80(const config &cfg) noexcept : m_config{ cfg } {
	for (const auto pin : m_config.data) {
		m_data_mask |= 1u << pin;
	}

	/*
	A lookup table is used to set the different bit patterns: 1 KB of RAM,
	but no shifting per byte sent.
	*/
	for (uint32_t value{}; value < std::size(m_masks); ++value) {
		for (uint32_t bit{}; bit < data_width; ++bit) {
			if (utils::get_bit_at(value, bit)) {
				m_masks[value] |= 1u << m_config.data[bit];
			}
		}
	}
}

auto i80::write_parameters(
	const uint8_t command,
	const std::span<const uint8_t> parameters
) -> result {
	select();

	command_mode();
	send_bits8(command);

	data_mode();
	for (const auto parameter : parameters) {
		send_bits8(parameter);
	}

	deselect();
	return {};
}

auto i80::read_parameters(const uint8_t command, const std::span<uint8_t> response) -> result {
	select();

	command_mode();
	send_bits8(command);
	data_mode();

	if (const auto error{ set_data_direction(GPIO_MODE_INPUT) }; error != ESP_OK) [[unlikely]] {
		deselect();
		return std::unexpected{ error };
	}

	for (uint8_t i{}; i < m_config.dummy_read_cycles; ++i) {
		static_cast<void>(receive_bits8());
	}
	for (auto &value : response) {
		value = receive_bits8();
	}

	const auto error{ set_data_direction(GPIO_MODE_OUTPUT) };
	deselect();

	if (error != ESP_OK) [[unlikely]] {
		return std::unexpected{ error };
	}
	return {};
}

auto i80::read_memory(const std::span<uint32_t> words) -> result {
	select();
	data_mode();

	if (const auto error{ set_data_direction(GPIO_MODE_INPUT) }; error != ESP_OK) [[unlikely]] {
		deselect();
		return std::unexpected{ error };
	}

	memory_word_decoder decoder{ m_config.memory_read, words };
	while (!decoder.done()) {
		decoder.push(receive_bits8());
	}

	const auto error{ set_data_direction(GPIO_MODE_OUTPUT) };
	deselect();

	if (error != ESP_OK) [[unlikely]] {
		return std::unexpected{ error };
	}
	return {};
}

auto i80::validate(const config &cfg) -> esp_err_t {
	const auto is_valid{ [](const gpio_num_t pin) {
		return pin != GPIO_NUM_NC && GPIO_IS_VALID_OUTPUT_GPIO(pin) && pin < GPIO_NUM_32;
	} };

	if (!is_valid(cfg.cs) || !is_valid(cfg.dc) || !is_valid(cfg.write) || !is_valid(cfg.read)) {
		ESP_LOGE(TAG, "Control pins must be output capable GPIOs below 32");
		return ESP_ERR_INVALID_ARG;
	}
	for (const auto pin : cfg.data) {
		if (!is_valid(pin)) {
			ESP_LOGE(TAG, "Data pin %d must be an output capable GPIO below 32", pin);
			return ESP_ERR_INVALID_ARG;
		}
	}
	if (cfg.memory_word_size == 0u || cfg.memory_word_size > sizeof(uint32_t)) {
		ESP_LOGE(TAG, "Memory word size %u is out of [1, 4]", cfg.memory_word_size);
		return ESP_ERR_INVALID_ARG;
	}
	if (cfg.memory_read.word_size == 0u || cfg.memory_read.word_size > sizeof(uint32_t)) {
		ESP_LOGE(TAG, "Memory read word size %u is out of [1, 4]", cfg.memory_read.word_size);
		return ESP_ERR_INVALID_ARG;
	}
	return ESP_OK;
}

auto i80::initialize_gpio(const config &cfg) -> esp_err_t {
	uint64_t pins_mask{
		  1ull << cfg.cs
		| 1ull << cfg.dc
		| 1ull << cfg.write
		| 1ull << cfg.read
	};
	for (const auto pin : cfg.data) {
		pins_mask |= 1ull << pin;
	}

	const gpio_config_t io_conf{
		.pin_bit_mask = pins_mask,
		.mode         = GPIO_MODE_OUTPUT,
		.pull_up_en   = GPIO_PULLUP_DISABLE,
		.pull_down_en = GPIO_PULLDOWN_DISABLE,
		.intr_type    = GPIO_INTR_DISABLE
	};
	if (const auto error{ gpio_config(&io_conf) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot configure GPIO: %s", esp_err_to_name(error));
		return error;
	}
	ESP_LOGI(TAG, "GPIO Configured");

	GPIO.out_w1ts = static_cast<uint32_t>(io_conf.pin_bit_mask);

	return ESP_OK;
}

auto i80::set_data_direction(const gpio_mode_t mode) const -> esp_err_t {
	for (const auto pin : m_config.data) {
		if (const auto error{ gpio_set_direction(pin, mode) }; error != ESP_OK) [[unlikely]] {
			ESP_LOGE(TAG, "Cannot switch GPIO%d direction: %s", pin, esp_err_to_name(error));
			return error;
		}
	}
	return ESP_OK;
}

auto i80::receive_bits8() const noexcept -> uint8_t {
	GPIO.out_w1tc = 1u << m_config.read;
	esp_rom_delay_us(READ_STROBE_US); // Data is valid after tRDL

	uint8_t value{};
	for (uint32_t bit{}; bit < data_width; ++bit) {
		value |= static_cast<uint8_t>(gpio_get_level(m_config.data[bit]) << bit);
	}

	GPIO.out_w1ts = 1u << m_config.read;
	esp_rom_delay_us(READ_STROBE_US);
	return value;
}

} // namespace ili9341::bus
