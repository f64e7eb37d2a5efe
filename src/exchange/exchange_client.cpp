#include "exchange/exchange_client.hpp"

#include "duckdb/common/assert.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"

namespace duckdb {

string ExchangeClientStatusToString(ExchangeClientStatus status) {
	switch (status) {
	case ExchangeClientStatus::QUEUED:
		return "QUEUED";
	case ExchangeClientStatus::RUNNING:
		return "RUNNING";
	case ExchangeClientStatus::FINISHED:
		return "FINISHED";
	case ExchangeClientStatus::FAILED:
		return "FAILED";
	case ExchangeClientStatus::CLOSED:
		return "CLOSED";
	default:
		return "UNKNOWN";
	}
}

ExchangeClient::ExchangeClient(DatabaseInstance &db_p, const ExchangeClientConfig &config, idx_t max_response_size_p,
                               std::shared_ptr<PageSourceFactory> page_source_factory_p,
                               std::shared_ptr<TaskExecutor> callback_executor_p,
                               std::shared_ptr<TaskExecutor> io_executor_p,
                               std::shared_ptr<SystemMemoryUsageListener> memory_listener)
    : db(db_p), max_response_size(max_response_size_p), min_error_duration(config.min_error_duration),
      max_error_duration(config.max_error_duration), page_source_factory(std::move(page_source_factory_p)),
      callback_executor(std::move(callback_executor_p)), io_executor(std::move(io_executor_p)),
      callback_group(callback_executor->NewTaskGroup()), io_group(io_executor->NewTaskGroup()),
      buffer(config.max_buffered_bytes), admission_controller(config.concurrent_request_multiplier, max_response_size_p),
      memory_bridge(std::move(memory_listener)) {
}

ExchangeClient::~ExchangeClient() {
	Close();
}

void ExchangeClient::AddLocation(const RemoteLocation &location) {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		if (IsTerminal()) {
			throw InvalidInputException("Cannot add location %s to a %s exchange client", location.ToString(),
			                            ExchangeClientStatusToString(status));
		}
		if (no_more_locations) {
			throw InvalidInputException("Cannot add location %s after no more locations was signalled",
			                            location.ToString());
		}
		for (auto &slot : slots) {
			if (slot.location == location) {
				return;
			}
		}
		slots.emplace_back(location);
		if (status == ExchangeClientStatus::QUEUED) {
			status = ExchangeClientStatus::RUNNING;
		}
		DUCKDB_LOG_DEBUG(db, StringUtil::Format("Exchange client registered location %s (%llu locations)",
		                                        location.ToString(), static_cast<idx_t>(slots.size())));

		ScheduleRequestsIfNecessary(actions, ExchangeClock::now());
		UpdateState(actions);
	}
	Dispatch(actions);
}

void ExchangeClient::NoMoreLocations() {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		if (IsTerminal()) {
			throw InvalidInputException("Cannot close the location set of a %s exchange client",
			                            ExchangeClientStatusToString(status));
		}
		if (no_more_locations) {
			return;
		}
		no_more_locations = true;
		if (status == ExchangeClientStatus::QUEUED) {
			status = ExchangeClientStatus::RUNNING;
		}
		UpdateState(actions);
	}
	Dispatch(actions);
}

ExchangePollResult ExchangeClient::PollPage() {
	ExchangePollResult result;
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		if (status == ExchangeClientStatus::FAILED) {
			throw IOException("Exchange client failed: %s", failure_message);
		}
		if (status == ExchangeClientStatus::CLOSED) {
			result.type = ExchangePollResultType::FINISHED;
			return result;
		}

		result.page = buffer.Poll();
		if (result.page) {
			result.type = ExchangePollResultType::PAGE;
			memory_bridge.Report(buffer.GetBufferedBytes());
			ScheduleRequestsIfNecessary(actions, ExchangeClock::now());
		}
		UpdateState(actions);
		if (!result.page && status == ExchangeClientStatus::FINISHED) {
			result.type = ExchangePollResultType::FINISHED;
		}
	}
	Dispatch(actions);
	return result;
}

bool ExchangeClient::IsFinished() const {
	std::lock_guard<std::mutex> lck(lock);
	return status == ExchangeClientStatus::FINISHED || status == ExchangeClientStatus::CLOSED;
}

bool ExchangeClient::IsClosed() const {
	std::lock_guard<std::mutex> lck(lock);
	return status == ExchangeClientStatus::CLOSED;
}

void ExchangeClient::Close() {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		if (status == ExchangeClientStatus::CLOSED) {
			return;
		}
		status = ExchangeClientStatus::CLOSED;
		ReleaseSources(SourceStatus::CLOSED, actions);
		actions.ready_callbacks = std::move(ready_callbacks);
		ready_callbacks.clear();
		DUCKDB_LOG_DEBUG(db, StringUtil::Format("Exchange client closed after receiving %llu pages (%llu bytes)",
		                                        pages_received, bytes_received));
	}
	Dispatch(actions);
}

void ExchangeClient::NotifyWhenReady(std::function<void()> callback) {
	{
		std::lock_guard<std::mutex> lck(lock);
		if (!IsReady()) {
			ready_callbacks.emplace_back(std::move(callback));
			return;
		}
	}
	callback();
}

ExchangeClientStatus ExchangeClient::GetStatus() const {
	std::lock_guard<std::mutex> lck(lock);
	return status;
}

idx_t ExchangeClient::GetBufferedBytes() const {
	std::lock_guard<std::mutex> lck(lock);
	return buffer.GetBufferedBytes();
}

vector<SourceStatus> ExchangeClient::GetSourceStatuses() const {
	std::lock_guard<std::mutex> lck(lock);
	vector<SourceStatus> statuses;
	statuses.reserve(slots.size());
	for (auto &slot : slots) {
		statuses.emplace_back(slot.GetStatus());
	}
	return statuses;
}

ExchangeClientStats ExchangeClient::GetStats() const {
	std::lock_guard<std::mutex> lck(lock);
	auto now = ExchangeClock::now();

	ExchangeClientStats stats;
	stats.status = status;
	stats.buffered_bytes = buffer.GetBufferedBytes();
	stats.buffered_pages = buffer.GetPageCount();
	stats.peak_buffered_bytes = buffer.GetPeakBufferedBytes();
	stats.max_buffered_bytes = buffer.GetMaxBufferedBytes();
	stats.outstanding_requests = outstanding_requests;
	stats.successful_requests = successful_requests;
	stats.failed_requests = failed_requests;
	stats.pages_received = pages_received;
	stats.bytes_received = bytes_received;
	stats.sources.reserve(slots.size());
	for (auto &slot : slots) {
		ExchangeSourceStats source_stats;
		source_stats.location = slot.location.ToString();
		source_stats.status = slot.GetStatus();
		if (slot.puller) {
			source_stats.token = slot.puller->GetToken();
			source_stats.error_count = slot.puller->GetErrorBudget().GetErrorCount();
			source_stats.request_outstanding = slot.puller->HasOutstandingRequest();
			if (slot.puller->GetErrorBudget().InFailureStreak()) {
				source_stats.last_error = slot.puller->GetLastError().ToString();
			}
		}
		stats.sources.emplace_back(std::move(source_stats));
	}
	return stats;
}

void ExchangeClient::HandleSourceEvent(SourceEvent event) {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		// Results arriving after close or failure are discarded.
		if (IsTerminal()) {
			return;
		}
		D_ASSERT(event.source_index < slots.size());
		auto &slot = slots[event.source_index];
		if (!slot.puller || !slot.puller->HasOutstandingRequest()) {
			return;
		}
		D_ASSERT(outstanding_requests > 0);
		--outstanding_requests;

		auto now = ExchangeClock::now();
		auto outcome = slot.puller->CompleteFetch(event, now);
		if (outcome.failed) {
			++failed_requests;
			LogRequestFailure(*slot.puller, outcome, now);
			if (outcome.exhausted) {
				Fail(StringUtil::Format("Source %s failed for %lldms: %s", slot.location.ToString(),
				                        static_cast<int64_t>(slot.puller->GetErrorBudget().GetFailureDuration(now).count()),
				                        outcome.error.ToString()),
				     actions);
			} else {
				actions.retry_wakeups.emplace_back(slot.puller->GetNextAttemptTime());
			}
		} else {
			++successful_requests;
			if (!outcome.pages.empty()) {
				pages_received += outcome.pages.size();
				bytes_received += buffer.Enqueue(std::move(outcome.pages));
				memory_bridge.Report(buffer.GetBufferedBytes());
			}
			if (outcome.acknowledge_token.IsValid()) {
				actions.acknowledgements.emplace_back(slot.puller->GetSource(), outcome.acknowledge_token.GetIndex());
			}
			if (outcome.finished) {
				DUCKDB_LOG_DEBUG(db, StringUtil::Format("Exchange source %s finished at token %llu",
				                                        slot.location.ToString(), slot.puller->GetToken()));
				actions.aborts.emplace_back(slot.puller->GetSource());
				slot.status = SourceStatus::FINISHED;
				slot.puller.reset();
			}
		}

		ScheduleRequestsIfNecessary(actions, now);
		UpdateState(actions);
	}
	Dispatch(actions);
}

void ExchangeClient::HandleRetryWakeup() {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		ScheduleRequestsIfNecessary(actions, ExchangeClock::now());
	}
	Dispatch(actions);
}

bool ExchangeClient::IsTerminal() const {
	return status == ExchangeClientStatus::CLOSED || status == ExchangeClientStatus::FAILED;
}

bool ExchangeClient::IsReady() const {
	return !buffer.IsEmpty() || status == ExchangeClientStatus::FINISHED || IsTerminal();
}

void ExchangeClient::ScheduleRequestsIfNecessary(PendingActions &actions, ExchangeClock::time_point now) {
	if (status != ExchangeClientStatus::RUNNING) {
		return;
	}
	auto admission_count = admission_controller.GetAdmissionCount(buffer, slots.size(), outstanding_requests);
	if (admission_count == 0) {
		return;
	}
	for (auto source_index : admission_controller.SelectSources(slots, admission_count, now)) {
		auto &slot = slots[source_index];
		if (!slot.puller) {
			std::shared_ptr<RemotePageSource> source;
			try {
				source = page_source_factory->CreatePageSource(slot.location);
			} catch (std::exception &ex) {
				Fail(StringUtil::Format("Failed to create page source for %s: %s", slot.location.ToString(), ex.what()),
				     actions);
				return;
			}
			slot.puller = make_uniq<SourcePuller>(slot.location, std::move(source),
			                                      ErrorBudget(min_error_duration, max_error_duration),
			                                      max_response_size);
		}
		auto token = slot.puller->StartFetch(now);
		++outstanding_requests;
		actions.fetches.emplace_back(FetchRequest {source_index, token, slot.puller->GetSource()});
	}
}

void ExchangeClient::UpdateState(PendingActions &actions) {
	if (status == ExchangeClientStatus::RUNNING && no_more_locations && buffer.IsEmpty()) {
		bool all_finished = true;
		for (auto &slot : slots) {
			if (slot.GetStatus() != SourceStatus::FINISHED) {
				all_finished = false;
				break;
			}
		}
		if (all_finished) {
			status = ExchangeClientStatus::FINISHED;
			DUCKDB_LOG_DEBUG(db, StringUtil::Format("Exchange client finished: %llu pages (%llu bytes) from %llu locations",
			                                        pages_received, bytes_received, static_cast<idx_t>(slots.size())));
		}
	}
	if (IsReady() && !ready_callbacks.empty()) {
		for (auto &callback : ready_callbacks) {
			actions.ready_callbacks.emplace_back(std::move(callback));
		}
		ready_callbacks.clear();
	}
}

void ExchangeClient::Fail(const string &message, PendingActions &actions) {
	if (IsTerminal()) {
		return;
	}
	DUCKDB_LOG_WARN(db, StringUtil::Format("Exchange client failed: %s", message));
	status = ExchangeClientStatus::FAILED;
	failure_message = message;
	ReleaseSources(SourceStatus::CLOSED, actions);
	for (auto &callback : ready_callbacks) {
		actions.ready_callbacks.emplace_back(std::move(callback));
	}
	ready_callbacks.clear();
}

void ExchangeClient::ReleaseSources(SourceStatus final_status, PendingActions &actions) {
	callback_executor->CancelGroup(callback_group);
	io_executor->CancelGroup(io_group);

	for (auto &slot : slots) {
		if (!slot.puller) {
			if (slot.status == SourceStatus::RUNNING) {
				slot.status = final_status;
			}
			continue;
		}
		// A failed source is aborted too, its producer still holds the buffer.
		auto puller_status = slot.puller->GetStatus();
		if (puller_status == SourceStatus::RUNNING || puller_status == SourceStatus::FAILED) {
			actions.aborts.emplace_back(slot.puller->GetSource());
		}
		slot.puller->Close();
		slot.status = slot.puller->GetStatus();
		slot.puller.reset();
	}
	outstanding_requests = 0;
	buffer.Clear();
	memory_bridge.Report(buffer.GetBufferedBytes());
}

void ExchangeClient::LogRequestFailure(const SourcePuller &puller, const FetchOutcome &outcome,
                                       ExchangeClock::time_point now) {
	auto location = puller.GetLocation().ToString();
	auto &error_budget = puller.GetErrorBudget();
	if (outcome.error.IsCapacityError()) {
		DUCKDB_LOG_WARN(db, StringUtil::Format("Oversized response from exchange source %s: %s", location,
		                                       outcome.error.ToString()));
	} else if (outcome.error.IsInvalid()) {
		DUCKDB_LOG_WARN(db, StringUtil::Format(
		                        "Corrupt response from exchange source %s, retrying until the producer recovers: %s",
		                        location, outcome.error.ToString()));
	} else {
		DUCKDB_LOG_DEBUG(db, StringUtil::Format(
		                         "Request to exchange source %s failed (%llu consecutive errors over %lldms): %s",
		                         location, error_budget.GetErrorCount(),
		                         static_cast<int64_t>(error_budget.GetFailureDuration(now).count()),
		                         outcome.error.ToString()));
	}
}

void ExchangeClient::Dispatch(PendingActions &actions) {
	for (auto &fetch : actions.fetches) {
		DispatchFetch(fetch);
	}

	// Acknowledgements and aborts are best effort, a failure only delays producer side cleanup.
	auto &db_instance = db;
	for (auto &acknowledgement : actions.acknowledgements) {
		auto source = acknowledgement.first;
		auto token = acknowledgement.second;
		auto accepted = io_executor->Execute(
		    [&db_instance, source, token]() {
			    auto status = source->Acknowledge(token);
			    if (!status.ok()) {
				    DUCKDB_LOG_DEBUG(db_instance,
				                     StringUtil::Format("Failed to acknowledge token %llu: %s", token, status.ToString()));
			    }
		    },
		    io_group);
		if (!accepted) {
			DUCKDB_LOG_DEBUG(db, StringUtil::Format("Skipped acknowledging token %llu, executor '%s' is stopped", token,
			                                        io_executor->GetName()));
		}
	}
	for (auto &source : actions.aborts) {
		auto accepted = io_executor->Execute([&db_instance, source]() {
			auto status = source->Abort();
			if (!status.ok()) {
				DUCKDB_LOG_DEBUG(db_instance,
				                 StringUtil::Format("Failed to abort exchange source: %s", status.ToString()));
			}
		});
		if (!accepted) {
			DUCKDB_LOG_DEBUG(db, StringUtil::Format("Skipped aborting an exchange source, executor '%s' is stopped",
			                                        io_executor->GetName()));
		}
	}

	auto now = ExchangeClock::now();
	std::weak_ptr<ExchangeClient> weak_client = weak_from_this();
	for (auto &wakeup : actions.retry_wakeups) {
		auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(wakeup - now);
		if (delay.count() < 0) {
			delay = std::chrono::milliseconds(0);
		}
		// Rounded up, so the wakeup never lands before the backoff elapsed.
		delay += std::chrono::milliseconds(1);
		auto scheduled = callback_executor->Schedule(
		    delay,
		    [weak_client]() {
			    auto client = weak_client.lock();
			    if (client) {
				    client->HandleRetryWakeup();
			    }
		    },
		    callback_group);
		if (!scheduled) {
			HandleRejectedTask(*callback_executor, "retry wakeup");
		}
	}

	// Ready callbacks are user code running on executor threads, a throwing callback must not take them down.
	for (auto &callback : actions.ready_callbacks) {
		try {
			callback();
		} catch (std::exception &ex) {
			DUCKDB_LOG_WARN(db, StringUtil::Format("Exchange client ready callback threw: %s", ex.what()));
		}
	}
}

void ExchangeClient::DispatchFetch(const FetchRequest &fetch) {
	std::weak_ptr<ExchangeClient> weak_client = weak_from_this();
	auto events = callback_executor;
	auto events_group = callback_group;
	auto request_size = max_response_size;
	auto accepted = io_executor->Execute(
	    [weak_client, events, events_group, fetch, request_size]() {
		    auto event = std::make_shared<SourceEvent>();
		    event->source_index = fetch.source_index;
		    event->request_token = fetch.token;
		    event->status = fetch.source->GetPages(fetch.token, request_size, event->response);
		    auto delivered = events->Execute(
		        [weak_client, event]() {
			        auto client = weak_client.lock();
			        if (client) {
				        client->HandleSourceEvent(std::move(*event));
			        }
		        },
		        events_group);
		    if (!delivered) {
			    // The completion is lost, so the request would stay outstanding forever.
			    auto client = weak_client.lock();
			    if (client) {
				    client->HandleRejectedTask(*events, "completion of a page request");
			    }
		    }
	    },
	    io_group);
	if (!accepted) {
		HandleRejectedTask(*io_executor, "page request");
	}
}

void ExchangeClient::HandleRejectedTask(const TaskExecutor &executor, const string &task_description) {
	PendingActions actions;
	{
		std::lock_guard<std::mutex> lck(lock);
		Fail(StringUtil::Format("Exchange executor '%s' rejected a %s", executor.GetName(), task_description), actions);
	}
	Dispatch(actions);
}

} // namespace duckdb
