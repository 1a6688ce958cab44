#pragma once

#include <span>
#include <array>
#include <ranges>
#include <cstdint>
#include <expected>
#include <concepts>

#include <esp_err.h>
#include <driver/gpio.h>
#include <soc/gpio_struct.h>

#include "ili9341/bus/memory_words.hpp"

namespace ili9341::bus {

/**
 * @brief Intel 8080 8-bit parallel interface driven by direct GPIO writes.
 *
 * Every pin has to be below GPIO 32, the writes go through the single
 * `GPIO.out_w1ts`/`GPIO.out_w1tc` register pair. CS stays low for a whole
 * frame. Reads are bit-banged through the RD line and are much slower than
 * writes, which is fine for register reads.
 */
class i80 {
public:
	using error_type = esp_err_t;
	using result     = std::expected<void, error_type>;

	static constexpr size_t data_width{ 8u };

	struct config {
		gpio_num_t cs   { GPIO_NUM_NC };
		gpio_num_t dc   { GPIO_NUM_NC }; ///< HIGH == data mode, LOW == command
		gpio_num_t write{ GPIO_NUM_NC };
		gpio_num_t read { GPIO_NUM_NC };
		std::array<gpio_num_t, data_width> data{
			GPIO_NUM_NC, GPIO_NUM_NC, GPIO_NUM_NC, GPIO_NUM_NC,
			GPIO_NUM_NC, GPIO_NUM_NC, GPIO_NUM_NC, GPIO_NUM_NC
		}; ///< D0..D7

		uint8_t memory_word_size { 2u }; ///< bytes per written pixel word, MSB first (1..4)
		uint8_t dummy_read_cycles{ 1u }; ///< discarded before a parameter response

		memory_read_format memory_read{}; ///< dummy cycles and bytes per pixel of 0x2E / 0x3E
	};

	[[nodiscard]]
	static auto create(const config &cfg) -> std::expected<i80, error_type>;

	auto write_parameters(const uint8_t command, const std::span<const uint8_t> parameters) -> result;
	auto read_parameters(const uint8_t command, const std::span<uint8_t> response) -> result;

	template<std::ranges::input_range Words>
		requires std::convertible_to<std::ranges::range_reference_t<Words>, uint32_t>
	auto write_memory(Words &&words) -> result {
		select();
		data_mode();
		for (const uint32_t word : words) {
			send_word(word);
		}
		deselect();
		return {};
	}

	auto read_memory(const std::span<uint32_t> words) -> result;

	[[nodiscard]]
	auto get_config() const noexcept -> const config & { return m_config; }

private:
	config                    m_config{};
	std::array<uint32_t, 256> m_masks{}; ///< data byte -> set mask of the data pins
	uint32_t                  m_data_mask{};

	explicit i80(const config &cfg) noexcept;

	static auto validate(const config &cfg) -> esp_err_t;
	static auto initialize_gpio(const config &cfg) -> esp_err_t;

	auto set_data_direction(const gpio_mode_t mode) const -> esp_err_t;
	auto receive_bits8() const noexcept -> uint8_t;

	[[gnu::always_inline]]
	inline void select() const noexcept { GPIO.out_w1tc = 1u << m_config.cs; }

	[[gnu::always_inline]]
	inline void deselect() const noexcept { GPIO.out_w1ts = 1u << m_config.cs; }

	[[gnu::always_inline]]
	inline void command_mode() const noexcept { GPIO.out_w1tc = 1u << m_config.dc; }

	[[gnu::always_inline]]
	inline void data_mode() const noexcept { GPIO.out_w1ts = 1u << m_config.dc; }

	[[gnu::always_inline]]
	inline void send_bits8(const uint8_t bits) const noexcept {
		GPIO.out_w1tc = m_data_mask | (1u << m_config.write); // Clear bus & write pin
		GPIO.out_w1ts = m_masks[bits];                         // Set the bus pins
		GPIO.out_w1ts = 1u << m_config.write;                  // Latched on the rising edge
	}

	[[gnu::always_inline]]
	inline void send_word(const uint32_t word) const noexcept {
		for (int32_t shift{ (m_config.memory_word_size - 1) * 8 }; shift >= 0; shift -= 8) {
			send_bits8(static_cast<uint8_t>(word >> shift));
		}
	}
};

} // namespace ili9341::bus
