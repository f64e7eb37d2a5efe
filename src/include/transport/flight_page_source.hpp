#pragma once

#include "duckdb/common/string.hpp"
#include "exchange.pb.h"
#include "exchange/remote_page_source.hpp"

#include <arrow/flight/api.h>
#include <arrow/util/cancel.h>
#include <memory>
#include <mutex>

namespace duckdb {

// Flight action type carrying every exchange request.
inline constexpr const char *EXCHANGE_ACTION_TYPE = "exchange";

// Default gRPC receive limit for exchange responses.
inline constexpr idx_t DEFAULT_MAX_CONTENT_LENGTH = 32ULL * 1024 * 1024;

// Page source reading one output buffer of a PageBufferServer over Arrow Flight.
class FlightPageSource : public RemotePageSource {
public:
	FlightPageSource(RemoteLocation location_p, idx_t max_content_length_p);
	~FlightPageSource() override = default;

	arrow::Status GetPages(idx_t token, idx_t max_size_in_bytes, PagesResponse &response) override;
	arrow::Status Acknowledge(idx_t token) override;
	arrow::Status Abort() override;
	void Cancel() override;

private:
	// The Flight client connects lazily, on the first call.
	arrow::Status EnsureConnected(arrow::flight::FlightClient *&flight_client);

	// Send a request and block wait its response. Cancellable calls stop once Cancel() was called.
	arrow::Status SendAction(const exchange::ExchangeRequest &req, exchange::ExchangeResponse &resp,
	                         bool cancellable);

	RemoteLocation location;
	idx_t max_content_length;
	arrow::StopSource stop_source;

	std::mutex connect_mutex;
	std::unique_ptr<arrow::flight::FlightClient> client;
};

class FlightPageSourceFactory : public PageSourceFactory {
public:
	explicit FlightPageSourceFactory(idx_t max_content_length_p = DEFAULT_MAX_CONTENT_LENGTH);

	std::shared_ptr<RemotePageSource> CreatePageSource(const RemoteLocation &location) override;
	idx_t GetMaxContentLength() const override {
		return max_content_length;
	}

private:
	idx_t max_content_length;
};

} // namespace duckdb
