#pragma once

#include <span>
#include <cstddef>
#include <algorithm>

namespace ili9341::bus {

/**
 * @brief Hands @p data to @p send in consecutive parts of at most
 * @p chunk_size elements, telling it which part is the last one.
 *
 * Stops at the first failed part and returns its status. Empty data sends
 * nothing.
 * @param send `(std::span<T> part, bool last) -> status`, where `status`
 * converts to `bool` and is default constructible as success.
 */
template<class T, class Send>
constexpr auto for_each_chunk(const std::span<T> data, const size_t chunk_size, Send &&send) {
	using status_type = decltype(send(data, true));

	for (size_t offset{}; offset < std::size(data); offset += chunk_size) {
		const auto part{ data.subspan(offset, std::min(chunk_size, std::size(data) - offset)) };
		if (auto status{ send(part, offset + std::size(part) == std::size(data)) }; !status) [[unlikely]] {
			return status;
		}
	}
	return status_type{};
}

} // namespace ili9341::bus
