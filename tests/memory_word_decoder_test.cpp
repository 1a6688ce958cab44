#include <array>
#include <vector>
#include <cstdint>

#include <gtest/gtest.h>

#include "ili9341/bus/memory_words.hpp"

namespace {

using ili9341::bus::memory_read_format;
using ili9341::bus::memory_word_decoder;

TEST(memory_word_decoder, DropsTheDummyReadThenPacksThreeBytesPerPixel) {
	// dummy, then R G B of two pixels
	const std::vector<uint8_t> stream{ 0xA5, 0xF8, 0x00, 0x00, 0x00, 0xFC, 0x00 };

	std::array<uint32_t, 2> pixels{};
	memory_word_decoder decoder{ memory_read_format{}, pixels };

	EXPECT_EQ(decoder.remaining_bytes(), std::size(stream));
	EXPECT_EQ(decoder.feed(stream), std::size(stream));

	EXPECT_TRUE(decoder.done());
	EXPECT_EQ(pixels, (std::array<uint32_t, 2>{ 0xF80000, 0x00FC00 }));
}

TEST(memory_word_decoder, ChunkBoundariesDoNotMatter) {
	const std::vector<uint8_t> stream{ 0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66 };

	std::array<uint32_t, 2> whole{};
	memory_word_decoder at_once{ memory_read_format{}, whole };
	static_cast<void>(at_once.feed(stream));

	std::array<uint32_t, 2> split{};
	memory_word_decoder byte_by_byte{ memory_read_format{}, split };
	for (const auto byte : stream) {
		byte_by_byte.push(byte);
	}

	EXPECT_EQ(whole, split);
	EXPECT_EQ(split, (std::array<uint32_t, 2>{ 0x112233, 0x445566 }));
}

TEST(memory_word_decoder, StopsOnceTheBufferIsFull) {
	const std::vector<uint8_t> stream{ 0x00, 0x12, 0x34, 0x56, 0x78, 0x9A };

	std::array<uint32_t, 1> pixel{};
	memory_word_decoder decoder{ memory_read_format{ .dummy_bytes = 1u, .word_size = 2u }, pixel };

	EXPECT_EQ(decoder.feed(stream), 3u);
	EXPECT_EQ(decoder.remaining_bytes(), 0u);
	EXPECT_EQ(pixel[0], 0x1234u);
}

TEST(memory_word_decoder, RemainingBytesCountsPartialWords) {
	std::array<uint32_t, 3> pixels{};
	memory_word_decoder decoder{ memory_read_format{ .dummy_bytes = 2u, .word_size = 3u }, pixels };

	EXPECT_EQ(decoder.remaining_bytes(), 11u);
	decoder.push(0xFF);
	decoder.push(0xFF);
	decoder.push(0x01);
	EXPECT_EQ(decoder.remaining_bytes(), 8u);
	EXPECT_FALSE(decoder.done());
}

TEST(memory_word_decoder, EmptyBufferStillWantsTheDummyRead) {
	std::array<uint32_t, 0> none{};
	memory_word_decoder decoder{ memory_read_format{}, none };

	EXPECT_FALSE(decoder.done());
	EXPECT_EQ(decoder.remaining_bytes(), 1u);

	decoder.push(0x00);
	EXPECT_TRUE(decoder.done());
}

} // namespace
