#define CATCH_CONFIG_RUNNER

#include "catch.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "exchange/exchange_client_factory.hpp"
#include "exchange_test_utils.hpp"
#include "transport/flight_page_source.hpp"
#include "transport/page_buffer_server.hpp"

#include <chrono>
#include <iostream>
#include <thread>

using namespace duckdb; // NOLINT

namespace {

// Global server instance, listening on an ephemeral port.
std::unique_ptr<DuckDB> g_db;
std::unique_ptr<PageBufferServer> g_server;
std::thread g_server_thread;

void SetupTestServer() {
	g_db = std::make_unique<DuckDB>(nullptr);
	g_server = std::make_unique<PageBufferServer>("0.0.0.0", /*port=*/0, g_db.get());
	auto status = g_server->Start();
	if (!status.ok()) {
		throw std::runtime_error("Failed to start server: " + status.ToString());
	}
	std::cout << "Test server started on " << g_server->GetLocation() << std::endl;

	// Run server (blocking) in the background.
	g_server_thread = std::thread([]() {
		auto serve_status = g_server->Serve();
		if (!serve_status.ok()) {
			std::cerr << "Server error: " << serve_status.ToString() << std::endl;
		}
	});
}

void TeardownTestServer() {
	if (g_server) {
		g_server->Shutdown();
	}
	if (g_server_thread.joinable()) {
		g_server_thread.join();
	}
	g_server.reset();
	g_db.reset();
	std::cout << "Test server shut down" << std::endl;
}

string MakePage(const string &buffer_id, idx_t index, idx_t size = 100) {
	auto page = StringUtil::Format("%s:%llu:", buffer_id, index);
	page.append(size - page.size(), 'x');
	return page;
}

void FillBuffer(const string &buffer_id, idx_t page_count, idx_t page_size = 100) {
	g_server->CreateBuffer(buffer_id);
	for (idx_t idx = 0; idx < page_count; ++idx) {
		g_server->AddPage(buffer_id, MakePage(buffer_id, idx, page_size));
	}
	g_server->SetNoMorePages(buffer_id);
}

ExchangeClientConfig MakeFlightConfig() {
	auto config = MakeTestConfig();
	config.min_error_duration = std::chrono::milliseconds(10);
	config.max_error_duration = std::chrono::seconds(2);
	return config;
}

} // namespace

TEST_CASE("Flight page source reads, acknowledges and aborts", "[flight_exchange]") {
	FillBuffer("direct", 4);
	FlightPageSource source(g_server->GetBufferLocation("direct"), DEFAULT_MAX_CONTENT_LENGTH);

	PagesResponse response;
	REQUIRE(source.GetPages(0, 250, response).ok());
	REQUIRE(response.token == 0);
	REQUIRE(response.next_token == 2);
	REQUIRE(response.pages.size() == 2);
	REQUIRE(response.pages[1]->GetData() == MakePage("direct", 1));
	REQUIRE_FALSE(response.buffer_complete);

	REQUIRE(source.Acknowledge(2).ok());
	REQUIRE(g_server->GetAcknowledgedToken("direct") == 2);
	REQUIRE(g_server->GetRetainedPageCount("direct") == 2);

	// Released pages cannot be requested again.
	PagesResponse stale;
	REQUIRE_FALSE(source.GetPages(0, 1000, stale).ok());

	REQUIRE(source.GetPages(2, 1000, response).ok());
	REQUIRE(response.pages.size() == 2);
	REQUIRE(response.next_token == 4);
	REQUIRE(response.buffer_complete);

	source.Cancel();
	REQUIRE(source.GetPages(4, 1000, response).IsCancelled());
	// Abort still reaches the producer after cancellation.
	REQUIRE(source.Abort().ok());
	REQUIRE_FALSE(g_server->HasBuffer("direct"));
}

TEST_CASE("Flight exchange reads two output buffers", "[flight_exchange]") {
	FillBuffer("two_buffers.a", 5);
	FillBuffer("two_buffers.b", 7);

	ExchangeClientFactory factory(*g_db->instance, MakeFlightConfig(), std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	client->AddLocation(g_server->GetBufferLocation("two_buffers.a"));
	client->AddLocation(g_server->GetBufferLocation("two_buffers.b"));
	client->NoMoreLocations();

	auto pages = DrainExchangeClient(*client);
	REQUIRE(pages.size() == 12);
	REQUIRE(client->GetStatus() == ExchangeClientStatus::FINISHED);

	idx_t next_a = 0;
	idx_t next_b = 0;
	for (auto &page : pages) {
		auto parsed = ParsePage(page);
		if (parsed.first == "two_buffers.a") {
			REQUIRE(parsed.second == next_a++);
		} else {
			REQUIRE(parsed.first == "two_buffers.b");
			REQUIRE(parsed.second == next_b++);
		}
	}
	REQUIRE(next_a == 5);
	REQUIRE(next_b == 7);

	// Finished buffers are released on the producer.
	REQUIRE(WaitFor([]() { return !g_server->HasBuffer("two_buffers.a") && !g_server->HasBuffer("two_buffers.b"); }));
}

TEST_CASE("Flight exchange streams pages added while reading", "[flight_exchange]") {
	g_server->CreateBuffer("streaming");

	ExchangeClientFactory factory(*g_db->instance, MakeFlightConfig(), std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	client->AddLocation(g_server->GetBufferLocation("streaming"));
	client->NoMoreLocations();
	REQUIRE(client->PollPage().type == ExchangePollResultType::NOT_READY);

	for (idx_t idx = 0; idx < 3; ++idx) {
		g_server->AddPage("streaming", MakePage("streaming", idx));
	}
	REQUIRE(WaitFor([&]() { return client->GetStats().pages_received == 3; }));
	REQUIRE(WaitFor([]() { return g_server->GetAcknowledgedToken("streaming") == 3; }));

	g_server->AddPage("streaming", MakePage("streaming", 3));
	g_server->AddPage("streaming", MakePage("streaming", 4));
	g_server->SetNoMorePages("streaming");

	auto pages = DrainExchangeClient(*client);
	REQUIRE(pages.size() == 5);
	for (idx_t idx = 0; idx < pages.size(); ++idx) {
		REQUIRE(pages[idx] == MakePage("streaming", idx));
	}
	REQUIRE(client->GetStatus() == ExchangeClientStatus::FINISHED);
}

TEST_CASE("Flight exchange carries pages above the default message size", "[flight_exchange]") {
	constexpr idx_t PAGE_SIZE = 5ULL * 1024 * 1024;
	FillBuffer("large_pages", 2, PAGE_SIZE);

	ExchangeClientFactory factory(*g_db->instance, MakeFlightConfig(), std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	client->AddLocation(g_server->GetBufferLocation("large_pages"));
	client->NoMoreLocations();

	auto pages = DrainExchangeClient(*client);
	REQUIRE(pages.size() == 2);
	REQUIRE(pages[0].size() == PAGE_SIZE);
	REQUIRE(pages[1] == MakePage("large_pages", 1, PAGE_SIZE));
	REQUIRE(client->GetStats().failed_requests == 0);
}

TEST_CASE("Flight exchange fails on an unknown output buffer", "[flight_exchange]") {
	auto config = MakeFlightConfig();
	config.max_error_duration = std::chrono::milliseconds(200);
	ExchangeClientFactory factory(*g_db->instance, config, std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	client->AddLocation(g_server->GetBufferLocation("missing"));
	client->NoMoreLocations();

	REQUIRE(WaitFor([&]() { return client->GetStatus() == ExchangeClientStatus::FAILED; }));
	REQUIRE(client->GetStats().failed_requests >= 2);
	REQUIRE_THROWS_AS(client->PollPage(), IOException);
}

TEST_CASE("Flight exchange fails on an unreachable producer", "[flight_exchange]") {
	auto config = MakeFlightConfig();
	config.max_error_duration = std::chrono::milliseconds(200);
	ExchangeClientFactory factory(*g_db->instance, config, std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	client->AddLocation(RemoteLocation("grpc://localhost:1", "nowhere"));
	client->NoMoreLocations();

	REQUIRE(WaitFor([&]() { return client->GetStatus() == ExchangeClientStatus::FAILED; }));
	REQUIRE_THROWS_AS(client->PollPage(), IOException);
}

TEST_CASE("Flight exchange close releases the producer", "[flight_exchange]") {
	g_server->CreateBuffer("closing");

	ExchangeClientFactory factory(*g_db->instance, MakeFlightConfig(), std::make_shared<FlightPageSourceFactory>());
	auto client = factory.CreateExchangeClient();
	auto requests_before = g_server->GetRequestCount();
	client->AddLocation(g_server->GetBufferLocation("closing"));
	// The producer has no pages yet, requests keep long polling.
	REQUIRE(WaitFor([&]() { return g_server->GetRequestCount() > requests_before; }));

	client->Close();
	REQUIRE(client->GetStatus() == ExchangeClientStatus::CLOSED);
	REQUIRE(client->GetBufferedBytes() == 0);
	REQUIRE(client->PollPage().type == ExchangePollResultType::FINISHED);
	REQUIRE(WaitFor([]() { return !g_server->HasBuffer("closing"); }));
}

int main(int argc, char **argv) {
	std::cout << "Setting up test server..." << std::endl;
	SetupTestServer();

	int result = Catch::Session().run(argc, argv);

	std::cout << "Tearing down test server..." << std::endl;
	TeardownTestServer();

	return result;
}
