#pragma once

#include <span>
#include <cstddef>
#include <cstdint>

namespace ili9341::bus {

/// Shape of the byte stream clocked out after Memory Read (0x2E / 0x3E).
struct memory_read_format {
	uint8_t dummy_bytes{ 1u }; ///< discarded before the first pixel
	uint8_t word_size  { 3u }; ///< bytes per pixel, MSB first (1..4)
};

/**
 * @brief Turns the raw memory read stream into pixel words.
 *
 * Bytes may be fed one by one or in chunks of any size. The leading dummy
 * bytes are dropped and every @ref memory_read_format::word_size bytes make
 * one word. With the default format an R5G6B5 pixel comes back as
 * `0x00RRGGBB`, each channel in the 6 upper bits of its byte.
 */
class memory_word_decoder {
public:
	constexpr memory_word_decoder(const memory_read_format format, const std::span<uint32_t> words) noexcept
		: m_format{ format }
		, m_words{ words }
		, m_dummy_left{ format.dummy_bytes } {}

	/// Consumes at most @ref remaining_bytes bytes of @p bytes.
	constexpr auto feed(const std::span<const uint8_t> bytes) noexcept -> size_t {
		size_t used{};
		for (; used < std::size(bytes) && !done(); ++used) {
			push(bytes[used]);
		}
		return used;
	}

	constexpr void push(const uint8_t byte) noexcept {
		if (m_dummy_left != 0u) {
			--m_dummy_left;
			return;
		}
		if (done()) [[unlikely]] {
			return;
		}

		m_current = (m_current << 8) | byte;
		if (++m_current_bytes == m_format.word_size) {
			m_words[m_filled++] = m_current;
			m_current       = 0u;
			m_current_bytes = 0u;
		}
	}

	[[nodiscard]]
	constexpr auto remaining_bytes() const noexcept -> size_t {
		return m_dummy_left + (std::size(m_words) - m_filled) * m_format.word_size - m_current_bytes;
	}

	[[nodiscard]]
	constexpr auto done() const noexcept -> bool {
		return m_dummy_left == 0u && m_filled == std::size(m_words);
	}

private:
	memory_read_format   m_format;
	std::span<uint32_t>  m_words;
	size_t               m_filled{};
	uint32_t             m_current{};
	uint8_t              m_current_bytes{};
	uint8_t              m_dummy_left{};
};

} // namespace ili9341::bus
