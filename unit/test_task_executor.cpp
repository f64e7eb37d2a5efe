#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "duckdb/common/exception.hpp"
#include "exchange/task_executor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace duckdb; // NOLINT

namespace {

bool WaitUntil(const std::function<bool()> &predicate) {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
	while (!predicate()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
	return true;
}

} // namespace

TEST_CASE("Task executor runs every task", "[task_executor]") {
	TaskExecutor executor("test", 4);
	std::atomic<idx_t> counter {0};
	for (idx_t idx = 0; idx < 100; ++idx) {
		REQUIRE(executor.Execute([&counter]() { ++counter; }));
	}
	REQUIRE(WaitUntil([&]() { return executor.GetStats().completed_tasks == 100; }));
	REQUIRE(counter.load() == 100);
	REQUIRE(executor.GetStats().queued_tasks == 0);
	REQUIRE(executor.GetName() == "test");
}

TEST_CASE("Task executor bounds concurrency by its thread count", "[task_executor]") {
	TaskExecutor executor("test", 2);
	std::atomic<idx_t> running {0};
	std::atomic<idx_t> max_running {0};
	for (idx_t idx = 0; idx < 10; ++idx) {
		executor.Execute([&]() {
			auto current = ++running;
			auto observed = max_running.load();
			while (observed < current && !max_running.compare_exchange_weak(observed, current)) {
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
			--running;
		});
	}
	REQUIRE(WaitUntil([&]() { return executor.GetStats().completed_tasks == 10; }));
	REQUIRE(max_running.load() <= 2);
	REQUIRE(executor.GetStats().thread_count == 2);
}

TEST_CASE("Task executor runs delayed tasks in due order", "[task_executor]") {
	TaskExecutor executor("test", 1);
	std::mutex mu;
	vector<idx_t> order;
	auto record = [&](idx_t value) {
		return [&, value]() {
			std::lock_guard<std::mutex> lck(mu);
			order.emplace_back(value);
		};
	};

	auto start = std::chrono::steady_clock::now();
	executor.Schedule(std::chrono::milliseconds(60), record(3));
	executor.Schedule(std::chrono::milliseconds(20), record(1));
	executor.Schedule(std::chrono::milliseconds(40), record(2));
	REQUIRE(executor.GetStats().queued_tasks == 3);

	REQUIRE(WaitUntil([&]() { return executor.GetStats().completed_tasks == 3; }));
	REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(60));
	std::lock_guard<std::mutex> lck(mu);
	REQUIRE(order.size() == 3);
	REQUIRE(order[0] == 1);
	REQUIRE(order[1] == 2);
	REQUIRE(order[2] == 3);
}

TEST_CASE("Task executor drops cancelled groups", "[task_executor]") {
	TaskExecutor executor("test", 1);
	auto group = executor.NewTaskGroup();
	auto other_group = executor.NewTaskGroup();
	REQUIRE(group != NO_TASK_GROUP);
	REQUIRE(group != other_group);

	// Occupy the only worker, so that everything else stays queued.
	std::atomic<bool> release {false};
	std::atomic<bool> started {false};
	executor.Execute([&]() {
		started = true;
		while (!release.load()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
	});
	REQUIRE(WaitUntil([&]() { return started.load(); }));

	std::atomic<idx_t> cancelled_runs {0};
	std::atomic<idx_t> kept_runs {0};
	for (idx_t idx = 0; idx < 5; ++idx) {
		executor.Execute([&]() { ++cancelled_runs; }, group);
	}
	executor.Schedule(std::chrono::milliseconds(5), [&]() { ++cancelled_runs; }, group);
	executor.Execute([&]() { ++kept_runs; }, other_group);
	executor.Execute([&]() { ++kept_runs; });

	REQUIRE(executor.CancelGroup(NO_TASK_GROUP) == 0);
	REQUIRE(executor.CancelGroup(group) == 6);
	REQUIRE(executor.CancelGroup(group) == 0);
	release = true;

	REQUIRE(WaitUntil([&]() { return kept_runs.load() == 2; }));
	REQUIRE(cancelled_runs.load() == 0);
	REQUIRE(executor.GetStats().cancelled_tasks == 6);
}

TEST_CASE("Task executor shutdown discards queued work", "[task_executor]") {
	TaskExecutor executor("test", 1);
	std::atomic<idx_t> runs {0};
	executor.Schedule(std::chrono::seconds(10), [&]() { ++runs; });
	REQUIRE_FALSE(executor.IsShutdown());

	executor.ShutdownNow();
	REQUIRE(executor.IsShutdown());
	REQUIRE_FALSE(executor.Execute([&]() { ++runs; }));
	REQUIRE_FALSE(executor.Schedule(std::chrono::milliseconds(1), [&]() { ++runs; }));
	REQUIRE(executor.GetStats().cancelled_tasks == 1);
	REQUIRE(executor.GetStats().queued_tasks == 0);
	// Idempotent.
	executor.ShutdownNow();
	REQUIRE(runs.load() == 0);
}

TEST_CASE("Task executor releases itself from one of its tasks", "[task_executor]") {
	auto executor = std::make_shared<TaskExecutor>("test", 2);
	std::atomic<bool> done {false};
	auto captured = executor;
	executor->Execute([captured, &done]() mutable {
		captured.reset();
		done = true;
	});
	executor.reset();
	REQUIRE(WaitUntil([&]() { return done.load(); }));
}

TEST_CASE("Task executor needs a thread", "[task_executor]") {
	REQUIRE_THROWS_AS(TaskExecutor("test", 0), InvalidInputException);
}
