#include <span>
#include <array>
#include <vector>
#include <ranges>
#include <cstdint>
#include <string>
#include <sstream>
#include <utility>
#include <expected>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ili9341/controller.hpp"

#include "mock_interface.hpp"
#include "recording_interface.hpp"

namespace {

using ili9341::test::write;
using ili9341::test::bus_error;
using ili9341::test::transaction;
using ili9341::test::recording_interface;

using controller = ili9341::controller<recording_interface>;

/// Transport whose write_memory only takes contiguous words.
struct span_only_bus {
	using error_type = bus_error;
	using result     = std::expected<void, error_type>;

	auto write_parameters(uint8_t, std::span<const uint8_t>) -> result { return {}; }
	auto read_parameters(uint8_t, std::span<uint8_t>) -> result { return {}; }
	auto write_memory(std::span<const uint32_t>) -> result { return {}; }
	auto read_memory(std::span<uint32_t>) -> result { return {}; }
};

static_assert(!ili9341::interface<span_only_bus>);
static_assert(ili9341::interface<recording_interface>);

template<class Controller, class Words>
concept streams = requires(Controller &lcd, Words &&words) { lcd.write_memory(std::forward<Words>(words)); };

static_assert(streams<controller, std::ranges::istream_view<uint32_t> &>);
static_assert(streams<controller, const std::vector<uint16_t> &>);
static_assert(!streams<controller, const std::vector<std::string> &>);

[[nodiscard]]
auto streamed(std::vector<uint32_t> words) -> transaction {
	return transaction{
		.type  = transaction::kind::write_memory,
		.words = std::move(words),
	};
}

[[nodiscard]]
auto fetched(const size_t length) -> transaction {
	return transaction{
		.type   = transaction::kind::read_memory,
		.length = length,
	};
}

class controller_memory : public ::testing::Test {
protected:
	controller lcd{ recording_interface{} };

	[[nodiscard]]
	auto sent() -> const std::vector<transaction> & { return lcd.bus().transactions; }
};

TEST_F(controller_memory, WriteMemoryHasNoCommandFraming) {
	const std::array<uint32_t, 3> pixels{ 0xF800, 0x07E0, 0x001F };

	ASSERT_TRUE(lcd.write_memory(pixels));

	const std::vector expected{ streamed({ 0xF800, 0x07E0, 0x001F }) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, WriteMemoryConsumesSinglePassRanges) {
	std::istringstream source{ "1 2 3 65535" };
	std::ranges::istream_view<uint32_t> words{ source };
	static_assert(!std::ranges::forward_range<decltype(words)>);

	ASSERT_TRUE(lcd.write_memory(words));

	const std::vector expected{ streamed({ 1, 2, 3, 65535 }) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, WriteMemoryAcceptsLazyViews) {
	auto pixels{
		std::views::iota(0u, 4u)
		| std::views::transform([](const uint32_t index) { return index << 11; })
	};

	ASSERT_TRUE(lcd.write_memory(pixels));

	const std::vector expected{ streamed({ 0x0000, 0x0800, 0x1000, 0x1800 }) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, FrameIsWindowThenStartThenPixels) {
	const std::vector<uint32_t> first{ 0xFFFF, 0x0000 };
	const std::vector<uint32_t> rest{ 0x1234 };

	ASSERT_TRUE(lcd.column_address_set(0, 1));
	ASSERT_TRUE(lcd.page_address_set(0, 1));
	ASSERT_TRUE(lcd.memory_write_start());
	ASSERT_TRUE(lcd.write_memory(first));
	ASSERT_TRUE(lcd.write_memory_continue());
	ASSERT_TRUE(lcd.write_memory(rest));

	const std::vector expected{
		write(0x2A, { 0x00, 0x00, 0x00, 0x01 }),
		write(0x2B, { 0x00, 0x00, 0x00, 0x01 }),
		write(0x2C),
		streamed({ 0xFFFF, 0x0000 }),
		write(0x3C),
		streamed({ 0x1234 }),
	};
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, ReadMemoryFillsTheBuffer) {
	lcd.bus().memory = { 0xF800, 0x07E0, 0x001F, 0xFFFF };

	std::array<uint32_t, 4> pixels{};
	ASSERT_TRUE(lcd.memory_read_start());
	ASSERT_TRUE(lcd.read_memory(pixels));

	EXPECT_EQ(pixels, (std::array<uint32_t, 4>{ 0xF800, 0x07E0, 0x001F, 0xFFFF }));

	const std::vector expected{ write(0x2E), fetched(4) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, ReadMemoryContinueResumes) {
	lcd.bus().memory = { 1, 2, 3 };

	std::array<uint32_t, 2> head{};
	std::array<uint32_t, 1> tail{};
	ASSERT_TRUE(lcd.memory_read_start());
	ASSERT_TRUE(lcd.read_memory(head));
	ASSERT_TRUE(lcd.read_memory_continue());
	ASSERT_TRUE(lcd.read_memory(tail));

	EXPECT_EQ(head, (std::array<uint32_t, 2>{ 1, 2 }));
	EXPECT_EQ(tail, (std::array<uint32_t, 1>{ 3 }));

	const std::vector expected{ write(0x2E), fetched(2), write(0x3E), fetched(1) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, EmptyWriteStillReachesTheInterface) {
	const std::vector<uint32_t> nothing{};

	ASSERT_TRUE(lcd.write_memory(nothing));

	const std::vector expected{ streamed({}) };
	EXPECT_EQ(sent(), expected);
}

TEST_F(controller_memory, MemoryFailuresArePropagated) {
	lcd.bus().failure = bus_error::clocking;

	const std::array<uint32_t, 1> pixel{ 0xFFFF };
	std::array<uint32_t, 1> buffer{};

	const auto written{ lcd.write_memory(pixel) };
	const auto read{ lcd.read_memory(buffer) };

	ASSERT_FALSE(written);
	ASSERT_FALSE(read);
	EXPECT_EQ(written.error(), bus_error::clocking);
	EXPECT_EQ(read.error(), bus_error::clocking);
}


TEST(controller_memory_mock, ReadMemoryHandsTheCallerBufferOver) {
	using ::testing::_;
	using ::testing::Invoke;

	::testing::StrictMock<ili9341::test::mock_bus> bus{};
	ili9341::controller lcd{ ili9341::test::mock_interface{ bus } };

	std::array<uint32_t, 2> pixels{};
	EXPECT_CALL(bus, read_memory(_))
		.WillOnce(Invoke([&pixels](const std::span<uint32_t> data) {
			EXPECT_EQ(std::data(data), std::data(pixels));
			EXPECT_EQ(std::size(data), std::size(pixels));
			data[0] = 0xABCD;
			data[1] = 0x0123;
			return ili9341::test::status{};
		}));

	ASSERT_TRUE(lcd.read_memory(pixels));
	EXPECT_EQ(pixels, (std::array<uint32_t, 2>{ 0xABCD, 0x0123 }));
}

TEST(controller_memory_mock, WriteMemoryFailureStopsNothingElse) {
	using ::testing::Return;
	::testing::InSequence sequence{};

	::testing::StrictMock<ili9341::test::mock_bus> bus{};
	ili9341::controller lcd{ ili9341::test::mock_interface{ bus } };

	EXPECT_CALL(bus, write_memory(ili9341::test::words{ 0x1111, 0x2222 }))
		.WillOnce(Return(std::unexpected{ bus_error::timeout }));
	EXPECT_CALL(bus, write_parameters(0x3C, ili9341::test::bytes{}))
		.WillOnce(Return(ili9341::test::status{}));

	const std::vector<uint32_t> pixels{ 0x1111, 0x2222 };
	const auto written{ lcd.write_memory(pixels) };
	ASSERT_FALSE(written);
	EXPECT_EQ(written.error(), bus_error::timeout);

	EXPECT_TRUE(lcd.write_memory_continue());
}

} // namespace
