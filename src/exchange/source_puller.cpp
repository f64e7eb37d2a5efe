#include "exchange/source_puller.hpp"

#include "duckdb/common/assert.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

string SourceStatusToString(SourceStatus status) {
	switch (status) {
	case SourceStatus::RUNNING:
		return "RUNNING";
	case SourceStatus::FINISHED:
		return "FINISHED";
	case SourceStatus::FAILED:
		return "FAILED";
	case SourceStatus::CLOSED:
		return "CLOSED";
	default:
		return "UNKNOWN";
	}
}

SourcePuller::SourcePuller(RemoteLocation location_p, std::shared_ptr<RemotePageSource> source_p,
                           ErrorBudget error_budget_p, idx_t max_response_size_p)
    : location(std::move(location_p)), source(std::move(source_p)), error_budget(error_budget_p),
      max_response_size(max_response_size_p) {
}

bool SourcePuller::CanFetch(ExchangeClock::time_point now) const {
	return status == SourceStatus::RUNNING && !request_outstanding && error_budget.GetNextAttemptTime() <= now;
}

idx_t SourcePuller::StartFetch(ExchangeClock::time_point now) {
	D_ASSERT(CanFetch(now));
	request_outstanding = true;
	error_budget.StartAttempt(now);
	return token;
}

arrow::Status SourcePuller::ValidateResponse(const SourceEvent &event) const {
	auto &response = event.response;
	auto response_size = response.SizeInBytes();
	if (response_size > max_response_size) {
		return arrow::Status::CapacityError(StringUtil::Format(
		    "Response from %s is %llu bytes, larger than the maximum response size of %llu bytes",
		    location.ToString(), response_size, max_response_size));
	}
	if (response.token != event.request_token) {
		return arrow::Status::Invalid(StringUtil::Format("Response from %s starts at token %llu, but %llu was requested",
		                                                 location.ToString(), response.token, event.request_token));
	}
	if (response.next_token != response.token + response.pages.size()) {
		return arrow::Status::Invalid(
		    StringUtil::Format("Response from %s carries %llu pages, but advances the token from %llu to %llu",
		                       location.ToString(), static_cast<idx_t>(response.pages.size()), response.token,
		                       response.next_token));
	}
	return arrow::Status::OK();
}

FetchOutcome SourcePuller::CompleteFetch(SourceEvent &event, ExchangeClock::time_point now) {
	D_ASSERT(request_outstanding);
	request_outstanding = false;

	FetchOutcome outcome;
	if (status != SourceStatus::RUNNING) {
		return outcome;
	}

	auto result_status = event.status;
	if (result_status.ok()) {
		result_status = ValidateResponse(event);
	}
	if (!result_status.ok()) {
		last_error = result_status;
		outcome.failed = true;
		outcome.error = result_status;
		outcome.exhausted = error_budget.Failure(now);
		if (outcome.exhausted) {
			status = SourceStatus::FAILED;
		}
		return outcome;
	}

	error_budget.Success();
	auto &response = event.response;
	if (!response.pages.empty()) {
		token = response.next_token;
		outcome.acknowledge_token = token;
		outcome.pages = std::move(response.pages);
	}
	if (response.buffer_complete) {
		status = SourceStatus::FINISHED;
		outcome.finished = true;
	}
	return outcome;
}

void SourcePuller::Close() {
	if (status != SourceStatus::RUNNING) {
		return;
	}
	status = SourceStatus::CLOSED;
	source->Cancel();
}

} // namespace duckdb
