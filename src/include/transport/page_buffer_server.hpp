#pragma once

#include "duckdb.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "exchange.pb.h"
#include "exchange/remote_page_source.hpp"

#include <arrow/flight/api.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace duckdb {

// Producer side of the exchange: serves named output buffers of pages over Arrow Flight.
//
// Pages of a buffer are numbered by tokens starting at 0. Requesting pages at a token, or acknowledging
// it, releases every page before it. Used by upstream tasks and by tests.
class PageBufferServer : public arrow::flight::FlightServerBase {
public:
	PageBufferServer(string host_p = "0.0.0.0", int port_p = 0, DuckDB *shared_db = nullptr);
	~PageBufferServer() override = default;

	arrow::Status Start();
	void Shutdown();
	string GetLocation() const;
	RemoteLocation GetBufferLocation(const string &buffer_id) const;

	// Producer operations. Adding to an unknown buffer throws InvalidInputException.
	void CreateBuffer(const string &buffer_id);
	void AddPage(const string &buffer_id, string page);
	void SetNoMorePages(const string &buffer_id);

	bool HasBuffer(const string &buffer_id) const;
	// Highest token the consumer acknowledged, explicitly or by requesting it.
	idx_t GetAcknowledgedToken(const string &buffer_id) const;
	// Pages not released yet.
	idx_t GetRetainedPageCount(const string &buffer_id) const;
	idx_t GetRequestCount() const {
		return request_count.load();
	}

	// Flight RPC methods.
	arrow::Status DoAction(const arrow::flight::ServerCallContext &context, const arrow::flight::Action &action,
	                       std::unique_ptr<arrow::flight::ResultStream> *result) override;

private:
	struct OutputBuffer {
		std::deque<string> pages;
		// Token of pages.front().
		idx_t first_token = 0;
		idx_t acknowledged_token = 0;
		bool no_more_pages = false;
	};

	arrow::Status HandleGetPages(const exchange::GetPagesRequest &req, exchange::ExchangeResponse &resp);
	arrow::Status HandleAcknowledge(const exchange::AcknowledgeRequest &req, exchange::ExchangeResponse &resp);
	arrow::Status HandleAbort(const exchange::AbortRequest &req, exchange::ExchangeResponse &resp);

	// Requires `buffers_mutex`. Returns false when the token is not in the buffer's range.
	static bool ReleasePagesBefore(OutputBuffer &buffer, idx_t token);
	OutputBuffer &GetBuffer(const string &buffer_id);
	const OutputBuffer &GetBuffer(const string &buffer_id) const;

	string host;
	int port;
	DuckDB *db;
	unique_ptr<DuckDB> owned_db;

	mutable std::mutex buffers_mutex;
	std::condition_variable buffers_changed;
	unordered_map<string, OutputBuffer> buffers;
	std::atomic<idx_t> request_count {0};
};

} // namespace duckdb
