#include "exchange/exchange_client_config.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

void ExchangeClientConfig::Validate() const {
	if (max_buffered_bytes == 0) {
		throw InvalidInputException("max_buffered_bytes must be at least 1 byte: %llu", max_buffered_bytes);
	}
	if (max_response_size == 0) {
		throw InvalidInputException("max_response_size must be at least 1 byte: %llu", max_response_size);
	}
	if (concurrent_request_multiplier == 0) {
		throw InvalidInputException("concurrent_request_multiplier must be at least 1: %llu",
		                            concurrent_request_multiplier);
	}
	if (min_error_duration.count() < 0) {
		throw InvalidInputException("min_error_duration must not be negative: %lldms",
		                            static_cast<int64_t>(min_error_duration.count()));
	}
	if (max_error_duration < min_error_duration) {
		throw InvalidInputException("max_error_duration (%lldms) must be at least min_error_duration (%lldms)",
		                            static_cast<int64_t>(max_error_duration.count()),
		                            static_cast<int64_t>(min_error_duration.count()));
	}
	if (max_callback_threads == 0) {
		throw InvalidInputException("max_callback_threads must be at least 1: %llu", max_callback_threads);
	}
	if (max_io_threads == 0) {
		throw InvalidInputException("max_io_threads must be at least 1: %llu", max_io_threads);
	}
}

idx_t ExchangeClientConfig::GetEffectiveMaxResponseSize(idx_t max_content_length) const {
	// TODO: Derive the framing overhead from the wire format instead of a fixed ratio.
	auto capped = MinValue<idx_t>(max_content_length, max_response_size);
	auto effective = static_cast<idx_t>(static_cast<double>(capped) * RESPONSE_SIZE_HEADROOM_RATIO);
	return MaxValue<idx_t>(effective, 1);
}

string ExchangeClientConfig::ToString() const {
	return StringUtil::Format("max_buffered_bytes=%llu, max_response_size=%llu, concurrent_request_multiplier=%llu, "
	                          "min_error_duration=%lldms, max_error_duration=%lldms, max_callback_threads=%llu, "
	                          "max_io_threads=%llu",
	                          max_buffered_bytes, max_response_size, concurrent_request_multiplier,
	                          static_cast<int64_t>(min_error_duration.count()),
	                          static_cast<int64_t>(max_error_duration.count()), max_callback_threads,
	                          max_io_threads);
}

} // namespace duckdb
