#pragma once

#include "duckdb.hpp"
#include "exchange/exchange_client.hpp"
#include "exchange/exchange_client_config.hpp"
#include "exchange/memory_accountant_bridge.hpp"
#include "exchange/remote_page_source.hpp"
#include "exchange/task_executor.hpp"

#include <memory>

namespace duckdb {

// Creates exchange clients sharing one transport, one callback executor and one I/O executor.
//
// The callback executor runs every request completion, its size is fixed by `max_callback_threads` no
// matter how many locations are registered. The database instance is only used for logging and must
// outlive the factory and every client it created.
class ExchangeClientFactory {
public:
	// Throws InvalidInputException for an invalid config.
	ExchangeClientFactory(DatabaseInstance &db_p, ExchangeClientConfig config_p,
	                      std::shared_ptr<PageSourceFactory> page_source_factory_p);
	~ExchangeClientFactory();

	ExchangeClientFactory(const ExchangeClientFactory &) = delete;
	ExchangeClientFactory &operator=(const ExchangeClientFactory &) = delete;

	// `memory_listener` may be null.
	std::shared_ptr<ExchangeClient>
	CreateExchangeClient(std::shared_ptr<SystemMemoryUsageListener> memory_listener = nullptr);

	// Terminate queued callback and transport work right away, without draining.
	void Stop();

	TaskExecutorStats GetCallbackExecutorStats() const;
	TaskExecutorStats GetIoExecutorStats() const;

	// Response size requested from sources, after applying the transport's content length cap.
	idx_t GetMaxResponseSize() const {
		return max_response_size;
	}
	const ExchangeClientConfig &GetConfig() const {
		return config;
	}

private:
	DatabaseInstance &db;
	const ExchangeClientConfig config;
	std::shared_ptr<PageSourceFactory> page_source_factory;
	idx_t max_response_size;
	std::shared_ptr<TaskExecutor> callback_executor;
	std::shared_ptr<TaskExecutor> io_executor;
};

} // namespace duckdb
