#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/typedefs.hpp"

#include <chrono>

namespace duckdb {

// Only this share of the transport's content length is requested, the rest is headroom for framing.
inline constexpr double RESPONSE_SIZE_HEADROOM_RATIO = 0.75;

struct ExchangeClientConfig {
	// Byte ceiling of pages buffered by one exchange client.
	idx_t max_buffered_bytes = 32ULL * 1024 * 1024;

	// Largest response requested from a single source.
	idx_t max_response_size = 16ULL * 1024 * 1024;

	// Outstanding requests allowed per registered location.
	idx_t concurrent_request_multiplier = 3;

	// Floor between two attempts against a failing source.
	std::chrono::milliseconds min_error_duration {std::chrono::minutes(1)};

	// A source failing continuously for this long fails the exchange.
	std::chrono::milliseconds max_error_duration {std::chrono::minutes(5)};

	// Threads running fetch completion callbacks, shared by all clients of a factory.
	idx_t max_callback_threads = 25;

	// Threads issuing blocking transport calls, shared by all clients of a factory.
	idx_t max_io_threads = 32;

	// Throws InvalidInputException on an invalid combination.
	void Validate() const;

	// Response size actually requested from sources, given the transport's content length cap.
	idx_t GetEffectiveMaxResponseSize(idx_t max_content_length) const;

	string ToString() const;
};

} // namespace duckdb
