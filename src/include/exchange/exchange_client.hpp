#pragma once

#include "duckdb.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "exchange/admission_controller.hpp"
#include "exchange/exchange_client_config.hpp"
#include "exchange/memory_accountant_bridge.hpp"
#include "exchange/page_buffer.hpp"
#include "exchange/remote_page_source.hpp"
#include "exchange/source_puller.hpp"
#include "exchange/task_executor.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace duckdb {

enum class ExchangeClientStatus : uint8_t {
	QUEUED,   // No location registered yet
	RUNNING,  // Sources running or pages buffered
	FINISHED, // Every source finished and the buffer is drained
	FAILED,   // A source exhausted its error budget
	CLOSED    // Released by the consumer
};

string ExchangeClientStatusToString(ExchangeClientStatus status);

enum class ExchangePollResultType : uint8_t {
	PAGE,      // `page` holds the next page
	NOT_READY, // No page buffered yet, poll again later
	FINISHED   // No page will ever arrive
};

struct ExchangePollResult {
	ExchangePollResultType type = ExchangePollResultType::NOT_READY;
	unique_ptr<SerializedPage> page;
};

struct ExchangeSourceStats {
	string location;
	SourceStatus status = SourceStatus::RUNNING;
	idx_t token = 0;
	idx_t error_count = 0;
	bool request_outstanding = false;
	string last_error;
};

struct ExchangeClientStats {
	ExchangeClientStatus status = ExchangeClientStatus::QUEUED;
	idx_t buffered_bytes = 0;
	idx_t buffered_pages = 0;
	idx_t peak_buffered_bytes = 0;
	idx_t max_buffered_bytes = 0;
	idx_t outstanding_requests = 0;
	idx_t successful_requests = 0;
	idx_t failed_requests = 0;
	idx_t pages_received = 0;
	idx_t bytes_received = 0;
	vector<ExchangeSourceStats> sources;
};

// Pulls pages from a set of remote locations into one memory bounded stream.
//
// Each location gets a SourcePuller with at most one outstanding request. Requests run on the I/O
// executor, their completions are handed to the callback executor as SourceEvents and applied under the
// client lock, which also guards the buffer and every status. Network calls never run under the lock.
//
// Instances are created by ExchangeClientFactory and must be owned by a std::shared_ptr.
class ExchangeClient : public std::enable_shared_from_this<ExchangeClient> {
public:
	ExchangeClient(DatabaseInstance &db_p, const ExchangeClientConfig &config, idx_t max_response_size_p,
	               std::shared_ptr<PageSourceFactory> page_source_factory_p,
	               std::shared_ptr<TaskExecutor> callback_executor_p, std::shared_ptr<TaskExecutor> io_executor_p,
	               std::shared_ptr<SystemMemoryUsageListener> memory_listener);
	~ExchangeClient();

	ExchangeClient(const ExchangeClient &) = delete;
	ExchangeClient &operator=(const ExchangeClient &) = delete;

	// Register a location to read from. Registering a known location again is a no-op.
	// Throws InvalidInputException once the client is closed or failed, or after NoMoreLocations().
	void AddLocation(const RemoteLocation &location);

	// No further locations will be added.
	void NoMoreLocations();

	// Never blocks. Throws IOException once the client failed.
	ExchangePollResult PollPage();

	// Whether no page will ever be returned again, either finished or closed.
	bool IsFinished() const;
	bool IsClosed() const;

	// Release every source and buffered page. Idempotent, safe concurrently with in-flight requests.
	void Close();

	// Run `callback` once a page is buffered or the client finished, failed or closed.
	// Runs immediately on the calling thread when that is already the case. Otherwise it runs on an
	// executor thread, where an exception it throws is logged and dropped.
	void NotifyWhenReady(std::function<void()> callback);

	ExchangeClientStatus GetStatus() const;
	idx_t GetBufferedBytes() const;
	// Status of every registered location, in registration order.
	vector<SourceStatus> GetSourceStatuses() const;
	ExchangeClientStats GetStats() const;

private:
	struct FetchRequest {
		idx_t source_index;
		idx_t token;
		std::shared_ptr<RemotePageSource> source;
	};

	// Work decided under the lock and carried out after releasing it.
	struct PendingActions {
		vector<FetchRequest> fetches;
		vector<std::pair<std::shared_ptr<RemotePageSource>, idx_t>> acknowledgements;
		vector<std::shared_ptr<RemotePageSource>> aborts;
		vector<ExchangeClock::time_point> retry_wakeups;
		vector<std::function<void()>> ready_callbacks;
	};

	// Single state-mutation path for request completions.
	void HandleSourceEvent(SourceEvent event);
	// Re-run admission once a backoff elapsed.
	void HandleRetryWakeup();

	// The helpers below require the lock.
	bool IsTerminal() const;
	bool IsReady() const;
	void ScheduleRequestsIfNecessary(PendingActions &actions, ExchangeClock::time_point now);
	void UpdateState(PendingActions &actions);
	void Fail(const string &message, PendingActions &actions);
	// Drop pullers and buffered pages, queueing an abort for every source still registered remotely.
	void ReleaseSources(SourceStatus final_status, PendingActions &actions);
	void LogRequestFailure(const SourcePuller &puller, const FetchOutcome &outcome, ExchangeClock::time_point now);

	// Carry out the actions, must be called without the lock.
	void Dispatch(PendingActions &actions);
	void DispatchFetch(const FetchRequest &fetch);
	// Fail the client when a stopped executor refused one of its tasks.
	void HandleRejectedTask(const TaskExecutor &executor, const string &task_description);

private:
	DatabaseInstance &db;
	const idx_t max_response_size;
	const std::chrono::milliseconds min_error_duration;
	const std::chrono::milliseconds max_error_duration;
	std::shared_ptr<PageSourceFactory> page_source_factory;
	std::shared_ptr<TaskExecutor> callback_executor;
	std::shared_ptr<TaskExecutor> io_executor;
	// Groups tagging this client's tasks on the shared executors.
	const idx_t callback_group;
	const idx_t io_group;

	mutable std::mutex lock;
	ExchangeClientStatus status = ExchangeClientStatus::QUEUED;
	vector<SourceSlot> slots;
	bool no_more_locations = false;
	PageBuffer buffer;
	AdmissionController admission_controller;
	MemoryAccountantBridge memory_bridge;
	idx_t outstanding_requests = 0;
	string failure_message;
	vector<std::function<void()>> ready_callbacks;

	idx_t successful_requests = 0;
	idx_t failed_requests = 0;
	idx_t pages_received = 0;
	idx_t bytes_received = 0;
};

} // namespace duckdb
