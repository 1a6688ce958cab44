#pragma once

#include <span>
#include <vector>
#include <ranges>
#include <cstdint>
#include <expected>
#include <algorithm>

#include <gmock/gmock.h>

#include "bus_error.hpp"

namespace ili9341::test {

using bytes  = std::vector<uint8_t>;
using words  = std::vector<uint32_t>;
using status = std::expected<void, bus_error>;
using reply  = std::expected<bytes, bus_error>;

/// Transactions as the panel would see them, with spans turned into vectors.
class mock_bus {
public:
	MOCK_METHOD(status, write_parameters, (uint8_t command, bytes parameters));
	MOCK_METHOD(reply,  read_parameters,  (uint8_t command, size_t length));
	MOCK_METHOD(status, write_memory,     (words data));
	MOCK_METHOD(status, read_memory,      (std::span<uint32_t> data));
};

/**
 * Copyable handle the controller owns. The mock itself can be neither copied
 * nor moved, so it stays in the test fixture.
 */
class mock_interface {
public:
	using error_type = bus_error;

	explicit mock_interface(mock_bus &bus) noexcept : m_bus{ &bus } {}

	auto write_parameters(const uint8_t command, const std::span<const uint8_t> parameters) -> status {
		return m_bus->write_parameters(command, bytes{ std::begin(parameters), std::end(parameters) });
	}

	auto read_parameters(const uint8_t command, const std::span<uint8_t> response) -> status {
		auto result{ m_bus->read_parameters(command, std::size(response)) };
		if (!result) {
			return std::unexpected{ result.error() };
		}
		std::ranges::copy(result->begin(), result->begin() + std::min(result->size(), response.size()), response.begin());
		return {};
	}

	template<std::ranges::input_range Words>
	auto write_memory(Words &&data) -> status {
		words collected{};
		for (const uint32_t word : data) {
			collected.push_back(word);
		}
		return m_bus->write_memory(std::move(collected));
	}

	auto read_memory(const std::span<uint32_t> data) -> status {
		return m_bus->read_memory(data);
	}

private:
	mock_bus *m_bus;
};

} // namespace ili9341::test
