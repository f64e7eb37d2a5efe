/*
 * Exchange Fetch Main Entry Point
 *
 * This executable reads remote output buffers through one exchange client:
 * - Registers every location given on the command line
 * - Drains pages as they arrive, bounded by the buffer size
 * - Prints the totals and per-location statistics once every source finished
 *
 * Usage:
 *   ./exchange_fetch <max_buffered_size> <location> [location ...]
 *
 * Arguments:
 *   max_buffered_size - Byte ceiling of buffered pages, for example 32MB
 *   location          - Output buffer as <scheme>://<host>:<port>/<buffer_id>
 *
 * Examples:
 *   ./exchange_fetch 32MB grpc://localhost:8817/buffer-0 grpc://localhost:8817/buffer-1
 *   ./exchange_fetch 1MB grpc://10.0.0.5:8817/query_1.stage_2.task_0
 */

#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

#include "duckdb/common/exception.hpp"
#include "duckdb/main/config.hpp"
#include "exchange/exchange_client_factory.hpp"
#include "transport/flight_page_source.hpp"

using namespace duckdb;

namespace {

// Block until the client has a page buffered or reached a terminal state.
void WaitUntilReady(ExchangeClient &client) {
	std::mutex mu;
	std::condition_variable cv;
	auto ready = std::make_shared<bool>(false);
	client.NotifyWhenReady([&mu, &cv, ready]() {
		std::lock_guard<std::mutex> lck(mu);
		*ready = true;
		cv.notify_all();
	});
	std::unique_lock<std::mutex> lck(mu);
	cv.wait(lck, [&ready]() { return *ready; });
}

} // namespace

int main(int argc, char *argv[]) {
	if (argc < 3) {
		std::cerr << "Usage: " << argv[0] << " <max_buffered_size> <location> [location ...]" << std::endl;
		return 1;
	}

	try {
		DuckDB db(nullptr);
		auto &db_instance = *db.instance;

		ExchangeClientConfig config;
		config.max_buffered_bytes = DBConfig::ParseMemoryLimit(argv[1]);
		config.min_error_duration = std::chrono::seconds(1);
		config.max_error_duration = std::chrono::seconds(30);

		ExchangeClientFactory factory(db_instance, config, std::make_shared<FlightPageSourceFactory>());
		auto client = factory.CreateExchangeClient();

		std::cout << "Starting Exchange Fetch" << std::endl;
		std::cout << "Max buffered bytes: " << config.max_buffered_bytes << std::endl;
		std::cout << "Max response size: " << factory.GetMaxResponseSize() << std::endl;
		for (int idx = 2; idx < argc; ++idx) {
			auto location = RemoteLocation::Parse(argv[idx]);
			std::cout << "Location: " << location.ToString() << std::endl;
			client->AddLocation(location);
		}
		client->NoMoreLocations();

		idx_t page_count = 0;
		idx_t byte_count = 0;
		while (true) {
			auto result = client->PollPage();
			if (result.type == ExchangePollResultType::FINISHED) {
				break;
			}
			if (result.type == ExchangePollResultType::NOT_READY) {
				WaitUntilReady(*client);
				continue;
			}
			++page_count;
			byte_count += result.page->SizeInBytes();
		}

		auto stats = client->GetStats();
		std::cout << "Received " << page_count << " pages (" << byte_count << " bytes)" << std::endl;
		std::cout << "Peak buffered bytes: " << stats.peak_buffered_bytes << std::endl;
		std::cout << "Requests: " << stats.successful_requests << " succeeded, " << stats.failed_requests << " failed"
		          << std::endl;
		for (auto &source : stats.sources) {
			std::cout << "  " << source.location << ": " << SourceStatusToString(source.status) << std::endl;
		}
		client->Close();
		factory.Stop();
	} catch (const std::exception &ex) {
		std::cerr << "Exchange fetch failed: " << ex.what() << std::endl;
		return 1;
	}

	return 0;
}
