#pragma once

#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "exchange/error_budget.hpp"
#include "exchange/remote_page_source.hpp"

#include <arrow/status.h>
#include <memory>

namespace duckdb {

enum class SourceStatus : uint8_t {
	RUNNING,  // More pages may arrive
	FINISHED, // End of stream reached
	FAILED,   // Error budget exhausted
	CLOSED    // Released by the consumer
};

string SourceStatusToString(SourceStatus status);

// Completion of one request against a source, delivered to the exchange client's state-mutation path.
struct SourceEvent {
	idx_t source_index = 0;
	// Token the request asked for.
	idx_t request_token = 0;
	// Transport outcome; the response is only meaningful when ok.
	arrow::Status status;
	PagesResponse response;
};

// What the exchange client has to do after a completion was applied.
struct FetchOutcome {
	// Pages to hand to the buffer, in source order.
	vector<unique_ptr<SerializedPage>> pages;
	// Set when the producer can release pages before this token.
	optional_idx acknowledge_token;
	// The source reached end of stream with this completion.
	bool finished = false;
	// The request failed; `exhausted` tells whether the error budget ran out.
	bool failed = false;
	bool exhausted = false;
	arrow::Status error;
};

// Fetch, retry and acknowledge state machine for exactly one remote location.
// Not thread safe, the owning exchange client serializes access; network calls happen elsewhere.
class SourcePuller {
public:
	SourcePuller(RemoteLocation location_p, std::shared_ptr<RemotePageSource> source_p, ErrorBudget error_budget_p,
	             idx_t max_response_size_p);

	// Whether a fetch may start at `now`: running, idle and past any backoff.
	bool CanFetch(ExchangeClock::time_point now) const;

	// Marks the single outstanding request and returns the token to request.
	idx_t StartFetch(ExchangeClock::time_point now);

	// Applies a completed request.
	FetchOutcome CompleteFetch(SourceEvent &event, ExchangeClock::time_point now);

	// Transition to CLOSED and cancel in-flight calls. No-op once finished or failed.
	void Close();

	const RemoteLocation &GetLocation() const {
		return location;
	}
	const std::shared_ptr<RemotePageSource> &GetSource() const {
		return source;
	}
	SourceStatus GetStatus() const {
		return status;
	}
	bool HasOutstandingRequest() const {
		return request_outstanding;
	}
	idx_t GetToken() const {
		return token;
	}
	idx_t GetMaxResponseSize() const {
		return max_response_size;
	}
	ExchangeClock::time_point GetNextAttemptTime() const {
		return error_budget.GetNextAttemptTime();
	}
	const ErrorBudget &GetErrorBudget() const {
		return error_budget;
	}
	const arrow::Status &GetLastError() const {
		return last_error;
	}

private:
	// Checks a successful transport response against the protocol.
	arrow::Status ValidateResponse(const SourceEvent &event) const;

	RemoteLocation location;
	std::shared_ptr<RemotePageSource> source;
	ErrorBudget error_budget;
	const idx_t max_response_size;

	SourceStatus status = SourceStatus::RUNNING;
	idx_t token = 0;
	bool request_outstanding = false;
	arrow::Status last_error;
};

} // namespace duckdb
