#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "duckdb/common/exception.hpp"
#include "exchange/exchange_client_config.hpp"
#include "exchange/remote_page_source.hpp"

using namespace duckdb; // NOLINT

TEST_CASE("Exchange client config defaults", "[exchange_client_config]") {
	ExchangeClientConfig config;
	REQUIRE(config.max_buffered_bytes == 32ULL * 1024 * 1024);
	REQUIRE(config.max_response_size == 16ULL * 1024 * 1024);
	REQUIRE(config.concurrent_request_multiplier == 3);
	REQUIRE(config.min_error_duration == std::chrono::minutes(1));
	REQUIRE(config.max_error_duration == std::chrono::minutes(5));
	REQUIRE(config.max_callback_threads == 25);
	REQUIRE_NOTHROW(config.Validate());
}

TEST_CASE("Exchange client config validation", "[exchange_client_config]") {
	ExchangeClientConfig config;

	SECTION("Zero buffer") {
		config.max_buffered_bytes = 0;
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
	SECTION("Zero response size") {
		config.max_response_size = 0;
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
	SECTION("Zero multiplier") {
		config.concurrent_request_multiplier = 0;
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
	SECTION("Maximum below minimum error duration") {
		config.min_error_duration = std::chrono::seconds(10);
		config.max_error_duration = std::chrono::seconds(5);
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
	SECTION("Zero minimum error duration") {
		config.min_error_duration = std::chrono::milliseconds(0);
		REQUIRE_NOTHROW(config.Validate());
	}
	SECTION("No callback threads") {
		config.max_callback_threads = 0;
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
	SECTION("No I/O threads") {
		config.max_io_threads = 0;
		REQUIRE_THROWS_AS(config.Validate(), InvalidInputException);
	}
}

TEST_CASE("Exchange client config effective response size", "[exchange_client_config]") {
	ExchangeClientConfig config;
	config.max_response_size = 16ULL * 1024 * 1024;

	// Capped by the transport.
	REQUIRE(config.GetEffectiveMaxResponseSize(8ULL * 1024 * 1024) == 6ULL * 1024 * 1024);
	// Capped by the configuration.
	REQUIRE(config.GetEffectiveMaxResponseSize(64ULL * 1024 * 1024) == 12ULL * 1024 * 1024);
	// Never zero.
	REQUIRE(config.GetEffectiveMaxResponseSize(1) == 1);

	auto description = config.ToString();
	REQUIRE(description.find("max_buffered_bytes=33554432") != string::npos);
	REQUIRE(description.find("min_error_duration=60000ms") != string::npos);
}

TEST_CASE("Remote location parsing", "[exchange_client_config]") {
	auto location = RemoteLocation::Parse("grpc://worker-1:8816/query_1.stage_2.task_0");
	REQUIRE(location.uri == "grpc://worker-1:8816");
	REQUIRE(location.buffer_id == "query_1.stage_2.task_0");
	REQUIRE(location.ToString() == "grpc://worker-1:8816/query_1.stage_2.task_0");
	REQUIRE(location == RemoteLocation("grpc://worker-1:8816", "query_1.stage_2.task_0"));
	REQUIRE(location != RemoteLocation("grpc://worker-2:8816", "query_1.stage_2.task_0"));

	REQUIRE_THROWS_AS(RemoteLocation::Parse("worker-1:8816/buffer"), InvalidInputException);
	REQUIRE_THROWS_AS(RemoteLocation::Parse("grpc://worker-1:8816"), InvalidInputException);
	REQUIRE_THROWS_AS(RemoteLocation::Parse("grpc://worker-1:8816/"), InvalidInputException);
}
