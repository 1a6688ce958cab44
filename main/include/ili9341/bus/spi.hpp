#pragma once

#include <span>
#include <memory>
#include <ranges>
#include <cstdint>
#include <expected>
#include <concepts>

#include <esp_err.h>
#include <esp_attr.h>
#include <driver/gpio.h>
#include <driver/spi_master.h>

#include "ili9341/bus/memory_words.hpp"

namespace ili9341::bus {

/**
 * @brief 4-wire serial interface (SCL, SDA/SDO, CS, D/CX) on top of
 * `driver/spi_master`.
 *
 * The SPI host must already be initialized with `spi_bus_initialize`. The
 * device runs half-duplex: a parameter read is one transaction made of the
 * command phase, the dummy clocks and the response. The D/CX line is switched
 * from the pre-transfer callback. Everything sent or received goes through a
 * DMA capable staging buffer of @ref config::chunk_words words, so the caller
 * memory may live anywhere.
 *
 * A frame split over several transactions holds the bus and keeps CS active
 * until its last transaction. Memory Read (0x2E / 0x3E) keeps both until the
 * following @ref read_memory, or until any other call ends the read.
 *
 * Move-only: the device is removed from the host on destruction.
 */
class spi {
public:
	using error_type = esp_err_t;
	using result     = std::expected<void, error_type>;

	struct config {
		spi_host_device_t host{ SPI2_HOST };
		gpio_num_t        cs  { GPIO_NUM_NC };
		gpio_num_t        dc  { GPIO_NUM_NC }; ///< HIGH == data, LOW == command
		int               clock_speed_hz{ 10'000'000 }; ///< tSCYCW is 100 ns
		uint8_t           read_dummy_bits{ 1u };  ///< before responses longer than 1 byte
		uint8_t           memory_word_size{ 2u }; ///< bytes per written pixel word, MSB first (1..4)
		size_t            chunk_words{ 1024u };

		memory_read_format memory_read{}; ///< dummy bytes and bytes per pixel of 0x2E / 0x3E
	};

	[[nodiscard]]
	static auto create(const config &cfg) -> std::expected<spi, error_type>;

	~spi();

	spi(const spi &) = delete;
	spi(spi &&other) noexcept;

	auto operator=(const spi &) -> spi & = delete;
	auto operator=(spi &&other) noexcept -> spi &;

	auto write_parameters(const uint8_t command, const std::span<const uint8_t> parameters) -> result;
	auto read_parameters(const uint8_t command, const std::span<uint8_t> response) -> result;

	template<std::ranges::input_range Words>
		requires std::convertible_to<std::ranges::range_reference_t<Words>, uint32_t>
	auto write_memory(Words &&words) -> result {
		end_memory_read();

		auto lock{ acquire_bus() };
		if (!lock) [[unlikely]] {
			return std::unexpected{ lock.error() };
		}

		const auto chunk{ staging_buffer() };
		size_t used{};

		for (const uint32_t word : words) {
			if (used == std::size(chunk)) {
				if (auto status{ transmit_data(chunk, cs_policy::keep) }; !status) [[unlikely]] {
					return status;
				}
				used = 0u;
			}
			for (int32_t shift{ (m_config.memory_word_size - 1) * 8 }; shift >= 0; shift -= 8) {
				chunk[used++] = static_cast<uint8_t>(word >> shift);
			}
		}

		if (used != 0u) {
			return transmit_data(chunk.first(used), cs_policy::release);
		}
		return {};
	}

	auto read_memory(const std::span<uint32_t> words) -> result;

	[[nodiscard]]
	auto get_config() const noexcept -> const config & { return m_config; }

private:
	struct heap_caps_deleter {
		void operator()(uint8_t *buffer) const noexcept;
	};

	struct bus_releaser {
		void operator()(spi_device_t *device) const noexcept;
	};

	/// Exclusive use of the SPI host, as given by `spi_device_acquire_bus`
	using bus_guard = std::unique_ptr<spi_device_t, bus_releaser>;

	enum class cs_policy : uint8_t {
		release, ///< CS goes inactive after the transaction
		keep     ///< CS stays active for the next one, the bus has to be held
	};

	config                                       m_config{};
	spi_device_handle_t                          m_device{};
	std::unique_ptr<uint8_t[], heap_caps_deleter> m_buffer{};
	bus_guard                                    m_memory_read{}; ///< held between 0x2E / 0x3E and read_memory

	spi(const config &cfg, spi_device_handle_t device,
		std::unique_ptr<uint8_t[], heap_caps_deleter> buffer) noexcept;

	void release() noexcept;

	[[nodiscard]]
	auto staging_buffer() const noexcept -> std::span<uint8_t> {
		return { m_buffer.get(), m_config.chunk_words * m_config.memory_word_size };
	}

	[[nodiscard]]
	static constexpr auto transaction_flags(const cs_policy policy) noexcept -> uint32_t {
		return policy == cs_policy::keep ? SPI_TRANS_CS_KEEP_ACTIVE : 0u;
	}

	auto acquire_bus() -> std::expected<bus_guard, error_type>;
	auto begin_memory_read(const uint8_t command) -> result;
	void end_memory_read() noexcept;

	auto transmit_command(const uint8_t command, const cs_policy policy) -> result;
	auto transmit_data(const std::span<const uint8_t> data, const cs_policy policy) -> result;
	auto receive_data(const std::span<uint8_t> data, const cs_policy policy) -> result;

	static auto validate(const config &cfg) -> esp_err_t;
	static void IRAM_ATTR pre_transfer_callback(spi_transaction_t *transaction);
};

} // namespace ili9341::bus
