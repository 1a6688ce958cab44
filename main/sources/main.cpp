#include <array>
#include <ranges>
#include <utility>
#include <expected>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <esp_log.h>
#include <driver/gpio.h>

#include "ili9341/config.hpp"
#include "ili9341/utils.hpp"
#include "ili9341/constants.hpp"
#include "ili9341/controller.hpp"

#if defined(ILI9341_BUS_SPI)
#include <driver/spi_master.h>
#include "ili9341/bus/spi.hpp"
#else
#include "ili9341/bus/i80.hpp"
#endif // defined(ILI9341_BUS_SPI)

static constexpr auto TAG{ "ili9341-demo" };

#if defined(ILI9341_BUS_SPI)
using bus_type = ili9341::bus::spi;
#else
using bus_type = ili9341::bus::i80;
#endif // defined(ILI9341_BUS_SPI)

using controller_type = ili9341::controller<bus_type>;

template<class Value>
static auto failed(const std::expected<Value, esp_err_t> &status, const char *what) -> bool {
	if (status) [[likely]] {
		return false;
	}
	ESP_LOGE(TAG, "%s failed: %s", what, esp_err_to_name(status.error()));
	return true;
}

static auto make_bus() -> std::expected<bus_type, esp_err_t> {
#if defined(ILI9341_BUS_SPI)
	const spi_bus_config_t bus_conf{
		.mosi_io_num     = ILI9341_PIN_MOSI,
		.miso_io_num     = ILI9341_PIN_MISO,
		.sclk_io_num     = ILI9341_PIN_SCLK,
		.quadwp_io_num   = -1,
		.quadhd_io_num   = -1,
		.max_transfer_sz = static_cast<int>(ili9341::constants::WIDTH * sizeof(uint16_t) * 16u),
	};
	if (const auto error{ spi_bus_initialize(ILI9341_SPI_HOST, &bus_conf, SPI_DMA_CH_AUTO) }; error != ESP_OK) {
		ESP_LOGE(TAG, "Cannot initialize SPI host: %s", esp_err_to_name(error));
		return std::unexpected{ error };
	}

	return ili9341::bus::spi::create({
		.host           = ILI9341_SPI_HOST,
		.cs             = static_cast<gpio_num_t>(ILI9341_PIN_CS),
		.dc             = static_cast<gpio_num_t>(ILI9341_PIN_DC),
		.clock_speed_hz = ILI9341_SPI_CLOCK_HZ,
		.chunk_words    = ili9341::constants::WIDTH * 8u,
	});
#else
	constexpr std::array<int, ili9341::bus::i80::data_width> data_pins{ ILI9341_PIN_DATA };

	ili9341::bus::i80::config cfg{
		.cs    = static_cast<gpio_num_t>(ILI9341_PIN_CS),
		.dc    = static_cast<gpio_num_t>(ILI9341_PIN_DC),
		.write = static_cast<gpio_num_t>(ILI9341_PIN_WRITE),
		.read  = static_cast<gpio_num_t>(ILI9341_PIN_READ),
	};
	for (size_t i{}; i < std::size(data_pins); ++i) {
		cfg.data[i] = static_cast<gpio_num_t>(data_pins[i]);
	}
	return ili9341::bus::i80::create(cfg);
#endif // defined(ILI9341_BUS_SPI)
}

static auto hardware_reset() -> esp_err_t {
	using namespace ili9341::utils::literals;
	constexpr auto reset_pin{ static_cast<gpio_num_t>(ILI9341_PIN_RESET) };

	const gpio_config_t io_conf{
		.pin_bit_mask = 1ull << reset_pin,
		.mode         = GPIO_MODE_OUTPUT,
		.pull_up_en   = GPIO_PULLUP_DISABLE,
		.pull_down_en = GPIO_PULLDOWN_DISABLE,
		.intr_type    = GPIO_INTR_DISABLE
	};
	if (const auto error{ gpio_config(&io_conf) }; error != ESP_OK) {
		ESP_LOGE(TAG, "Cannot configure RESX: %s", esp_err_to_name(error));
		return error;
	}

	gpio_set_level(reset_pin, 1);
	vTaskDelay(5_ms);

	gpio_set_level(reset_pin, 0);
	vTaskDelay(20_ms);

	gpio_set_level(reset_pin, 1);
	vTaskDelay(150_ms); // wait reset completion

	return ESP_OK;
}

static auto bring_up(controller_type &lcd) -> bool {
	using namespace ili9341::utils::literals;

	if (failed(lcd.software_reset(), "software_reset")) { return false; }
	vTaskDelay(120_ms); // 5 ms before the next command, 120 ms before sleep out

	if (failed(lcd.sleep_out(), "sleep_out")) { return false; }
	vTaskDelay(120_ms);

	if (failed(lcd.pixel_format_set(ili9341::make_pixel_format(ili9341::pixel_format_value::R5G6B5)), "pixel_format_set")) {
		return false;
	}
	const auto madctl{ ili9341::make_memory_access_control(ili9341::orientation::portrait) };
	if (failed(lcd.memory_access_control(madctl), "memory_access_control")) { return false; }
	if (failed(lcd.display_inversion(false), "display_inversion")) { return false; }
	if (failed(lcd.normal_display_mode_on(), "normal_display_mode_on")) { return false; }
	if (failed(lcd.tearing_effect(ili9341::tearing_effect::vblank_only), "tearing_effect")) { return false; }
	if (failed(lcd.display(true), "display")) { return false; }

	return true;
}

static void report(controller_type &lcd) {
	if (const auto id{ lcd.read_display_identification() }; !failed(id, "read_display_identification")) {
		ESP_LOGI(TAG, "Identification: %02X %02X %02X", id->raw[0], id->raw[1], id->raw[2]);
	}

	const auto id1{ lcd.read_id1() };
	const auto id2{ lcd.read_id2() };
	const auto id3{ lcd.read_id3() };
	if (!failed(id1, "read_id1") && !failed(id2, "read_id2") && !failed(id3, "read_id3")) {
		ESP_LOGI(TAG, "ID1 %02X, ID2 %02X, ID3 %02X", *id1, *id2, *id3);
	}

	if (const auto status{ lcd.read_display_status() }; !failed(status, "read_display_status")) {
		ESP_LOGI(TAG, "Status: %02X %02X %02X %02X",
			status->raw[0], status->raw[1], status->raw[2], status->raw[3]
		);
	}
	if (const auto mode{ lcd.read_display_power_mode() }; !failed(mode, "read_display_power_mode")) {
		ESP_LOGI(TAG, "Power mode: %02X", mode->raw[0]);
	}
	if (const auto diagnostic{ lcd.read_self_diagnostic_result() }; !failed(diagnostic, "read_self_diagnostic_result")) {
		ESP_LOGI(TAG, "Self-diagnostic: %02X", diagnostic->raw[0]);
	}
}

[[gnu::always_inline]]
static inline auto gradient(const size_t index) -> uint32_t {
	using namespace ili9341::constants;

	const auto x{ static_cast<uint32_t>(index % WIDTH) };
	const auto y{ static_cast<uint32_t>(index / WIDTH) };
	const uint32_t red  { (y * 31u) / HEIGHT };
	const uint32_t green{ (x * 63u) / WIDTH };
	const uint32_t blue { 31u - red };
	return (red << 11) | (green << 5) | blue;
}

static auto fill_screen(controller_type &lcd) -> bool {
	using namespace ili9341::constants;

	if (failed(lcd.column_address_set(0u, WIDTH - 1u), "column_address_set")) { return false; }
	if (failed(lcd.page_address_set(0u, HEIGHT - 1u), "page_address_set")) { return false; }
	if (failed(lcd.memory_write_start(), "memory_write_start")) { return false; }

	// The frame is generated while it is sent: no framebuffer at all
	auto pixels{ std::views::iota(size_t{}, PIXELS_COUNT) | std::views::transform(gradient) };
	return !failed(lcd.write_memory(pixels), "write_memory");
}

static void scroll_loop(controller_type &lcd) {
	using namespace ili9341::utils::literals;
	using namespace ili9341::constants;

	if (failed(lcd.vertical_scrolling_definition(0u, HEIGHT, 0u), "vertical_scrolling_definition")) {
		return;
	}

	uint16_t line{};
	while (true) {
		if (failed(lcd.vertical_scrolling_start_address(line), "vertical_scrolling_start_address")) {
			return;
		}
		line = static_cast<uint16_t>((line + 1u) % HEIGHT);

		if (line == 0u) {
			if (const auto scanline{ lcd.get_scanline() }; !failed(scanline, "get_scanline")) {
				ESP_LOGD(TAG, "Wrapped around at scanline %u", *scanline);
			}
		}
		vTaskDelay(16_ms);
	}
}

extern "C" void app_main(void) {
	if (hardware_reset() != ESP_OK) {
		return;
	}

	auto bus{ make_bus() };
	if (!bus) {
		ESP_LOGE(TAG, "Failed to create the bus: %s", esp_err_to_name(bus.error()));
		return;
	}

	controller_type lcd{ std::move(*bus) };
	if (!bring_up(lcd)) {
		ESP_LOGE(TAG, "Failed to bring the panel up");
		return;
	}
	ESP_LOGI(TAG, "Panel %ux%u is up", ili9341::constants::WIDTH, ili9341::constants::HEIGHT);

	report(lcd);

	if (!fill_screen(lcd)) {
		return;
	}
	scroll_loop(lcd);
}
