#include <utility>
#include <cstring>
#include <algorithm>

#include <freertos/FreeRTOS.h>

#include <esp_log.h>
#include <esp_heap_caps.h>

#include "ili9341/bus/spi.hpp"
#include "ili9341/bus/chunks.hpp"

#include "ili9341/commands.hpp"

namespace ili9341::bus {

inline constexpr auto TAG{ "[ili9341::bus::spi]" };

inline constexpr uint32_t LOW { 0u };
inline constexpr uint32_t HIGH{ 1u };

inline constexpr uint8_t COMMAND_BITS{ 8u };

enum class send_policy : uint32_t {
	command = LOW,
	data    = HIGH
};

/// The pre-transfer callback only sees the transaction, so the D/CX pin and
/// its level travel in `user`.
[[gnu::always_inline]]
static inline auto is_memory_read(const uint8_t command) noexcept -> bool {
	return command == std::to_underlying(command_id::READ_MEMORY_START)
		|| command == std::to_underlying(command_id::READ_MEMORY_CONTINUE);
}

[[gnu::always_inline]]
static inline auto make_user(const gpio_num_t dc, const send_policy policy) noexcept -> void * {
	return reinterpret_cast<void *>(
		(static_cast<uintptr_t>(dc) << 1) | static_cast<uintptr_t>(policy)
	);
}

auto spi::create(const config &cfg) -> std::expected<spi, error_type> {
	if (const auto error{ validate(cfg) }; error != ESP_OK) [[unlikely]] {
		return std::unexpected{ error };
	}

	const gpio_config_t io_conf{
		.pin_bit_mask = 1ull << cfg.dc,
		.mode         = GPIO_MODE_OUTPUT,
		.pull_up_en   = GPIO_PULLUP_DISABLE,
		.pull_down_en = GPIO_PULLDOWN_DISABLE,
		.intr_type    = GPIO_INTR_DISABLE
	};
	if (const auto error{ gpio_config(&io_conf) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot configure D/CX pin: %s", esp_err_to_name(error));
		return std::unexpected{ error };
	}

	const size_t buffer_size{ cfg.chunk_words * cfg.memory_word_size };
	std::unique_ptr<uint8_t[], heap_caps_deleter> buffer{
		static_cast<uint8_t *>(heap_caps_malloc(buffer_size, MALLOC_CAP_DMA | MALLOC_CAP_8BIT))
	};
	if (!buffer) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot allocate %zu bytes of DMA memory", buffer_size);
		return std::unexpected{ ESP_ERR_NO_MEM };
	}

	const spi_device_interface_config_t device_conf{
		.mode           = 0,
		.clock_speed_hz = cfg.clock_speed_hz,
		.spics_io_num   = cfg.cs,
		.flags          = SPI_DEVICE_HALFDUPLEX,
		.queue_size     = 1,
		.pre_cb         = pre_transfer_callback,
	};
	spi_device_handle_t device{};
	if (const auto error{ spi_bus_add_device(cfg.host, &device_conf, &device) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot add device to SPI host %d: %s", cfg.host, esp_err_to_name(error));
		return std::unexpected{ error };
	}
	ESP_LOGI(TAG, "Device added to SPI host %d at %d Hz", cfg.host, cfg.clock_speed_hz);

	return spi{ cfg, device, std::move(buffer) };
}

spi::spi(
	const config &cfg,
	spi_device_handle_t device,
	std::unique_ptr<uint8_t[], heap_caps_deleter> buffer
) noexcept
	: m_config{ cfg }
	, m_device{ device }
	, m_buffer{ std::move(buffer) } {}

spi::~spi() {
	release();
}

spi::spi(spi &&other) noexcept
	: m_config{ other.m_config }
	, m_device{ std::exchange(other.m_device, nullptr) }
	, m_buffer{ std::move(other.m_buffer) }
	, m_memory_read{ std::move(other.m_memory_read) } {}

auto spi::operator=(spi &&other) noexcept -> spi & {
	if (this != &other) {
		release();
		m_config = other.m_config;
		m_device = std::exchange(other.m_device, nullptr);
		m_buffer = std::move(other.m_buffer);
		m_memory_read = std::move(other.m_memory_read);
	}
	return *this;
}

void spi::release() noexcept {
	m_memory_read.reset();
	if (m_device == nullptr) {
		return;
	}
	if (const auto error{ spi_bus_remove_device(m_device) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGW(TAG, "Cannot remove device: %s", esp_err_to_name(error));
	}
	m_device = nullptr;
}

auto spi::write_parameters(
	const uint8_t command,
	const std::span<const uint8_t> parameters
) -> result {
	end_memory_read();

	if (std::empty(parameters)) {
		if (is_memory_read(command)) {
			return begin_memory_read(command);
		}
		return transmit_command(command, cs_policy::release);
	}

	auto lock{ acquire_bus() };
	if (!lock) [[unlikely]] {
		return std::unexpected{ lock.error() };
	}
	if (auto status{ transmit_command(command, cs_policy::keep) }; !status) [[unlikely]] {
		return status;
	}

	const auto chunk{ staging_buffer() };
	return for_each_chunk(parameters, std::size(chunk), [this, chunk](const auto part, const bool last) {
		std::ranges::copy(part, std::begin(chunk));
		return transmit_data(chunk.first(std::size(part)), last ? cs_policy::release : cs_policy::keep);
	});
}

auto spi::read_parameters(const uint8_t command, const std::span<uint8_t> response) -> result {
	end_memory_read();

	if (std::empty(response)) {
		return transmit_command(command, cs_policy::release);
	}

	const auto chunk{ staging_buffer() };
	if (std::size(response) > std::size(chunk)) [[unlikely]] {
		ESP_LOGE(TAG, "Response of %zu bytes does not fit the staging buffer", std::size(response));
		return std::unexpected{ ESP_ERR_INVALID_SIZE };
	}

	spi_transaction_ext_t description{
		.base = {
			.flags     = SPI_TRANS_VARIABLE_CMD | SPI_TRANS_VARIABLE_DUMMY,
			.cmd       = command,
			.rxlength  = std::size(response) * size_t{ 8u },
			.user      = make_user(m_config.dc, send_policy::command),
			.rx_buffer = std::data(chunk),
		},
		.command_bits = COMMAND_BITS,
		.dummy_bits   = static_cast<uint8_t>(std::size(response) > 1u ? m_config.read_dummy_bits : 0u),
	};
	if (const auto error{ spi_device_polling_transmit(m_device, &description.base) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot read 0x%02X: %s", command, esp_err_to_name(error));
		return std::unexpected{ error };
	}

	std::ranges::copy(chunk.first(std::size(response)), std::begin(response));
	return {};
}

auto spi::read_memory(const std::span<uint32_t> words) -> result {
	if (!m_memory_read) [[unlikely]] {
		ESP_LOGE(TAG, "Memory read has to follow 0x2E or 0x3E");
		return std::unexpected{ ESP_ERR_INVALID_STATE };
	}
	const bus_guard lock{ std::move(m_memory_read) };

	const auto chunk{ staging_buffer() };
	memory_word_decoder decoder{ m_config.memory_read, words };

	while (!decoder.done()) {
		const auto part{ chunk.first(std::min(std::size(chunk), decoder.remaining_bytes())) };
		const auto policy{ std::size(part) == decoder.remaining_bytes() ? cs_policy::release : cs_policy::keep };
		if (auto status{ receive_data(part, policy) }; !status) [[unlikely]] {
			return status;
		}
		decoder.feed(part);
	}
	return {};
}

auto spi::acquire_bus() -> std::expected<bus_guard, error_type> {
	if (const auto error{ spi_device_acquire_bus(m_device, portMAX_DELAY) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot acquire the SPI host: %s", esp_err_to_name(error));
		return std::unexpected{ error };
	}
	return bus_guard{ m_device };
}

auto spi::begin_memory_read(const uint8_t command) -> result {
	auto lock{ acquire_bus() };
	if (!lock) [[unlikely]] {
		return std::unexpected{ lock.error() };
	}
	if (auto status{ transmit_command(command, cs_policy::keep) }; !status) [[unlikely]] {
		return status;
	}
	m_memory_read = std::move(*lock);
	return {};
}

/// The panel ends a pending memory read on the next command, so the bus only has to be released
void spi::end_memory_read() noexcept {
	m_memory_read.reset();
}

auto spi::transmit_command(const uint8_t command, const cs_policy policy) -> result {
	spi_transaction_t description{
		.flags   = SPI_TRANS_USE_TXDATA | transaction_flags(policy),
		.length  = COMMAND_BITS,
		.user    = make_user(m_config.dc, send_policy::command),
		.tx_data = { command }
	};
	if (const auto error{ spi_device_polling_transmit(m_device, &description) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot send command 0x%02X: %s", command, esp_err_to_name(error));
		return std::unexpected{ error };
	}
	return {};
}

/// @p data has to live in the staging buffer
auto spi::transmit_data(const std::span<const uint8_t> data, const cs_policy policy) -> result {
	spi_transaction_t description{
		.flags     = transaction_flags(policy),
		.length    = std::size(data) * size_t{ 8u },
		.user      = make_user(m_config.dc, send_policy::data),
		.tx_buffer = std::data(data),
	};
	if (const auto error{ spi_device_polling_transmit(m_device, &description) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot send %zu bytes: %s", std::size(data), esp_err_to_name(error));
		return std::unexpected{ error };
	}
	return {};
}

/// @p data has to live in the staging buffer
auto spi::receive_data(const std::span<uint8_t> data, const cs_policy policy) -> result {
	spi_transaction_t description{
		.flags     = transaction_flags(policy),
		.rxlength  = std::size(data) * size_t{ 8u },
		.user      = make_user(m_config.dc, send_policy::data),
		.rx_buffer = std::data(data),
	};
	if (const auto error{ spi_device_polling_transmit(m_device, &description) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot receive %zu bytes: %s", std::size(data), esp_err_to_name(error));
		return std::unexpected{ error };
	}
	return {};
}

auto spi::validate(const config &cfg) -> esp_err_t {
	if (!GPIO_IS_VALID_OUTPUT_GPIO(cfg.dc)) {
		ESP_LOGE(TAG, "D/CX pin %d is not an output capable GPIO", cfg.dc);
		return ESP_ERR_INVALID_ARG;
	}
	if (cfg.memory_word_size == 0u || cfg.memory_word_size > sizeof(uint32_t)) {
		ESP_LOGE(TAG, "Memory word size %u is out of [1, 4]", cfg.memory_word_size);
		return ESP_ERR_INVALID_ARG;
	}
	if (cfg.memory_read.word_size == 0u || cfg.memory_read.word_size > sizeof(uint32_t)) {
		ESP_LOGE(TAG, "Memory read word size %u is out of [1, 4]", cfg.memory_read.word_size);
		return ESP_ERR_INVALID_ARG;
	}
	if (cfg.chunk_words == 0u) {
		ESP_LOGE(TAG, "Staging buffer cannot be empty");
		return ESP_ERR_INVALID_ARG;
	}
	return ESP_OK;
}

void spi::heap_caps_deleter::operator()(uint8_t *buffer) const noexcept {
	heap_caps_free(buffer);
}

void spi::bus_releaser::operator()(spi_device_t *device) const noexcept {
	spi_device_release_bus(device);
}

void spi::pre_transfer_callback(spi_transaction_t *transaction) {
	const auto user{ reinterpret_cast<uintptr_t>(transaction->user) };
	gpio_set_level(static_cast<gpio_num_t>(user >> 1), static_cast<uint32_t>(user & 0x01u));
}

} // namespace ili9341::bus
