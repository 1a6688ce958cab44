#pragma once

#include <span>
#include <ranges>
#include <cstdint>
#include <istream>
#include <concepts>
#include <expected>

namespace ili9341 {

/**
 * @brief Transport the controller talks through (SPI, 8/16-bit parallel,
 * memory mapped FMC, ...).
 *
 * Every call blocks until the transaction is over. Failures are reported as
 * `std::unexpected(error_type)` and are never retried by the caller side.
 *
 * - `write_parameters(command, data)` sends the command byte followed by
 *   `data` (possibly empty) as one frame.
 * - `read_parameters(command, response)` sends the command byte and clocks
 *   back exactly `response.size()` bytes.
 * - `write_memory(words)` streams pixel words without any command framing.
 *   It has to accept any single-pass input range of `uint32_t`, so a
 *   transport implements it as a template; the concept checks it with a span
 *   and with an `istream_view`, which can be walked only once.
 * - `read_memory(words)` fills `words.size()` pixel words.
 */
template<class T>
concept interface = requires(
	T &bus,
	const uint8_t command,
	std::span<const uint8_t> parameters,
	std::span<uint8_t> response,
	std::span<const uint32_t> words,
	std::ranges::istream_view<uint32_t> &lazy,
	std::span<uint32_t> buffer
) {
	typename T::error_type;

	{ bus.write_parameters(command, parameters) } -> std::same_as<std::expected<void, typename T::error_type>>;
	{ bus.read_parameters(command, response) }    -> std::same_as<std::expected<void, typename T::error_type>>;
	{ bus.write_memory(words) }                   -> std::same_as<std::expected<void, typename T::error_type>>;
	{ bus.write_memory(lazy) }                    -> std::same_as<std::expected<void, typename T::error_type>>;
	{ bus.read_memory(buffer) }                   -> std::same_as<std::expected<void, typename T::error_type>>;
};

template<class Value, interface Interface>
using result = std::expected<Value, typename Interface::error_type>;

} // namespace ili9341
