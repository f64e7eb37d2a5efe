#include "exchange/exchange_client_factory.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"

namespace duckdb {

ExchangeClientFactory::ExchangeClientFactory(DatabaseInstance &db_p, ExchangeClientConfig config_p,
                                             std::shared_ptr<PageSourceFactory> page_source_factory_p)
    : db(db_p), config(std::move(config_p)), page_source_factory(std::move(page_source_factory_p)) {
	config.Validate();
	if (!page_source_factory) {
		throw InvalidInputException("Exchange client factory requires a page source factory");
	}
	max_response_size = config.GetEffectiveMaxResponseSize(page_source_factory->GetMaxContentLength());

	callback_executor = std::make_shared<TaskExecutor>("page-buffer-client-callback", config.max_callback_threads);
	io_executor = std::make_shared<TaskExecutor>("exchange-io", config.max_io_threads);

	DUCKDB_LOG_DEBUG(db, StringUtil::Format("Exchange client factory created with %s, effective max response size %llu bytes",
	                                        config.ToString(), max_response_size));
}

ExchangeClientFactory::~ExchangeClientFactory() {
	Stop();
}

std::shared_ptr<ExchangeClient>
ExchangeClientFactory::CreateExchangeClient(std::shared_ptr<SystemMemoryUsageListener> memory_listener) {
	return std::make_shared<ExchangeClient>(db, config, max_response_size, page_source_factory, callback_executor,
	                                        io_executor, std::move(memory_listener));
}

void ExchangeClientFactory::Stop() {
	if (callback_executor->IsShutdown() && io_executor->IsShutdown()) {
		return;
	}
	callback_executor->ShutdownNow();
	io_executor->ShutdownNow();
	DUCKDB_LOG_DEBUG(db, "Exchange client factory stopped");
}

TaskExecutorStats ExchangeClientFactory::GetCallbackExecutorStats() const {
	return callback_executor->GetStats();
}

TaskExecutorStats ExchangeClientFactory::GetIoExecutorStats() const {
	return io_executor->GetStats();
}

} // namespace duckdb
