#pragma once

#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "exchange/page_buffer.hpp"
#include "exchange/source_puller.hpp"

namespace duckdb {

// Registration of one location inside an exchange client.
struct SourceSlot {
	explicit SourceSlot(RemoteLocation location_p) : location(std::move(location_p)) {
	}

	RemoteLocation location;
	// Created on first admission, released once the source finished or failed.
	unique_ptr<SourcePuller> puller;
	// Status while no puller exists: RUNNING before the first admission, final status afterwards.
	SourceStatus status = SourceStatus::RUNNING;

	SourceStatus GetStatus() const {
		return puller ? puller->GetStatus() : status;
	}
};

// Decides which sources may start a fetch.
//
// No fetch is admitted while the buffer is full. Below the ceiling, every outstanding fetch reserves
// `max_response_size` bytes and fetches are only admitted while
// `buffered + outstanding * max_response_size` stays within one response of the ceiling, so the buffer
// never overshoots by more than one response. One fetch is always admitted when none is outstanding.
// On top of that at most `concurrent_request_multiplier * location_count` fetches are outstanding in
// aggregate, and each source has at most one.
class AdmissionController {
public:
	AdmissionController(idx_t concurrent_request_multiplier_p, idx_t max_response_size_p);

	idx_t GetMaxOutstandingRequests(idx_t location_count) const {
		return concurrent_request_multiplier * location_count;
	}

	// Number of additional fetches allowed right now.
	idx_t GetAdmissionCount(const PageBuffer &buffer, idx_t location_count, idx_t outstanding_requests) const;

	// Picks up to `count` sources able to fetch at `now`, round-robin across calls.
	vector<idx_t> SelectSources(const vector<SourceSlot> &slots, idx_t count, ExchangeClock::time_point now);

private:
	const idx_t concurrent_request_multiplier;
	const idx_t max_response_size;
	// Where the next round-robin scan starts.
	idx_t next_source = 0;
};

} // namespace duckdb
