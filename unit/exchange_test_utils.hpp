#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"
#include "exchange/exchange_client.hpp"
#include "exchange/exchange_client_config.hpp"
#include "exchange/memory_accountant_bridge.hpp"
#include "exchange/remote_page_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace duckdb {

// Concurrency observed across every fake source sharing one transport.
struct FakeTransportStats {
	std::atomic<idx_t> in_flight {0};
	std::atomic<idx_t> max_in_flight {0};

	void Enter() {
		auto current = ++in_flight;
		auto observed = max_in_flight.load();
		while (observed < current && !max_in_flight.compare_exchange_weak(observed, current)) {
		}
	}
	void Exit() {
		--in_flight;
	}
};

// Failure count making every request fail.
inline constexpr idx_t ALWAYS_FAIL = std::numeric_limits<idx_t>::max();

// In-memory producer of `page_count` pages of `page_size` bytes.
// Every page starts with "<name>:<index>:" so that consumers can check ordering.
class FakePageSource : public RemotePageSource {
public:
	FakePageSource(string name_p, idx_t page_count_p, idx_t page_size_p,
	               std::shared_ptr<FakeTransportStats> transport_p = nullptr)
	    : name(std::move(name_p)), page_count(page_count_p), page_size(page_size_p),
	      transport(std::move(transport_p)) {
	}

	arrow::Status GetPages(idx_t token, idx_t max_size_in_bytes, PagesResponse &response) override {
		std::unique_lock<std::mutex> lck(mu);
		++get_pages_calls;
		if (cancelled) {
			return arrow::Status::Cancelled("Fake source ", name, " was cancelled");
		}
		InFlightGuard guard(*this);
		unblocked.wait(lck, [&]() { return !blocked || cancelled; });
		if (cancelled) {
			return arrow::Status::Cancelled("Fake source ", name, " was cancelled");
		}
		if (response_delay.count() > 0) {
			lck.unlock();
			std::this_thread::sleep_for(response_delay);
			lck.lock();
		}
		if (failures_remaining > 0) {
			if (failures_remaining != ALWAYS_FAIL) {
				--failures_remaining;
			}
			return arrow::Status::IOError("Fake source ", name, " is unavailable");
		}

		response.token = token;
		response.pages.clear();
		idx_t response_size = 0;
		auto next_token = token;
		while (next_token < page_count) {
			if (!oversized && !response.pages.empty() && response_size + page_size > max_size_in_bytes) {
				break;
			}
			response.pages.emplace_back(make_uniq<SerializedPage>(MakePage(next_token)));
			response_size += page_size;
			++next_token;
		}
		response.next_token = next_token;
		response.buffer_complete = next_token >= page_count;
		return arrow::Status::OK();
	}

	arrow::Status Acknowledge(idx_t token) override {
		std::lock_guard<std::mutex> lck(mu);
		acknowledged_token = MaxValue<idx_t>(acknowledged_token, token);
		return arrow::Status::OK();
	}

	arrow::Status Abort() override {
		std::lock_guard<std::mutex> lck(mu);
		++abort_calls;
		return arrow::Status::OK();
	}

	void Cancel() override {
		{
			std::lock_guard<std::mutex> lck(mu);
			cancelled = true;
		}
		unblocked.notify_all();
	}

	// Hold every GetPages call until Unblock() or Cancel().
	void Block() {
		std::lock_guard<std::mutex> lck(mu);
		blocked = true;
	}
	void Unblock() {
		{
			std::lock_guard<std::mutex> lck(mu);
			blocked = false;
		}
		unblocked.notify_all();
	}
	void FailRequests(idx_t count) {
		std::lock_guard<std::mutex> lck(mu);
		failures_remaining = count;
	}
	// Ignore the requested size and answer with every remaining page.
	void SetOversized(bool oversized_p) {
		std::lock_guard<std::mutex> lck(mu);
		oversized = oversized_p;
	}
	void SetResponseDelay(std::chrono::milliseconds delay) {
		std::lock_guard<std::mutex> lck(mu);
		response_delay = delay;
	}

	const string &GetName() const {
		return name;
	}
	idx_t GetPagesCalls() const {
		std::lock_guard<std::mutex> lck(mu);
		return get_pages_calls;
	}
	idx_t GetAcknowledgedToken() const {
		std::lock_guard<std::mutex> lck(mu);
		return acknowledged_token;
	}
	idx_t GetAbortCalls() const {
		std::lock_guard<std::mutex> lck(mu);
		return abort_calls;
	}
	bool IsCancelled() const {
		std::lock_guard<std::mutex> lck(mu);
		return cancelled;
	}
	idx_t GetInFlight() const {
		return in_flight.load();
	}
	idx_t GetMaxInFlight() const {
		return max_in_flight.load();
	}

	string MakePage(idx_t index) const {
		auto page = StringUtil::Format("%s:%llu:", name, index);
		if (page.size() < page_size) {
			page.append(page_size - page.size(), 'x');
		}
		return page;
	}

private:
	struct InFlightGuard {
		explicit InFlightGuard(FakePageSource &source_p) : source(source_p) {
			auto current = ++source.in_flight;
			auto observed = source.max_in_flight.load();
			while (observed < current && !source.max_in_flight.compare_exchange_weak(observed, current)) {
			}
			if (source.transport) {
				source.transport->Enter();
			}
		}
		~InFlightGuard() {
			if (source.transport) {
				source.transport->Exit();
			}
			--source.in_flight;
		}
		FakePageSource &source;
	};

	const string name;
	const idx_t page_count;
	const idx_t page_size;
	std::shared_ptr<FakeTransportStats> transport;

	mutable std::mutex mu;
	std::condition_variable unblocked;
	bool blocked = false;
	bool cancelled = false;
	bool oversized = false;
	idx_t failures_remaining = 0;
	std::chrono::milliseconds response_delay {0};

	idx_t get_pages_calls = 0;
	idx_t acknowledged_token = 0;
	idx_t abort_calls = 0;
	std::atomic<idx_t> in_flight {0};
	std::atomic<idx_t> max_in_flight {0};
};

// Hands out registered fake sources; unknown locations throw.
class FakePageSourceFactory : public PageSourceFactory {
public:
	explicit FakePageSourceFactory(idx_t max_content_length_p = 64ULL * 1024 * 1024)
	    : max_content_length(max_content_length_p) {
	}

	RemoteLocation Register(std::shared_ptr<FakePageSource> source) {
		RemoteLocation location("fake://producer:1", source->GetName());
		std::lock_guard<std::mutex> lck(mu);
		sources[location.ToString()] = std::move(source);
		return location;
	}

	std::shared_ptr<RemotePageSource> CreatePageSource(const RemoteLocation &location) override {
		std::lock_guard<std::mutex> lck(mu);
		++create_calls;
		auto iter = sources.find(location.ToString());
		if (iter == sources.end()) {
			throw InvalidInputException("No fake source registered for %s", location.ToString());
		}
		return iter->second;
	}

	idx_t GetMaxContentLength() const override {
		return max_content_length;
	}

	idx_t GetCreateCalls() const {
		std::lock_guard<std::mutex> lck(mu);
		return create_calls;
	}

private:
	const idx_t max_content_length;
	mutable std::mutex mu;
	std::map<string, std::shared_ptr<FakePageSource>> sources;
	idx_t create_calls = 0;
};

class RecordingMemoryListener : public SystemMemoryUsageListener {
public:
	void UpdateSystemMemoryUsage(int64_t delta_bytes, idx_t total_bytes) override {
		std::lock_guard<std::mutex> lck(mu);
		delta_sum += delta_bytes;
		last_total = total_bytes;
		peak_total = MaxValue<idx_t>(peak_total, total_bytes);
		++update_count;
	}

	int64_t GetDeltaSum() const {
		std::lock_guard<std::mutex> lck(mu);
		return delta_sum;
	}
	idx_t GetLastTotal() const {
		std::lock_guard<std::mutex> lck(mu);
		return last_total;
	}
	idx_t GetPeakTotal() const {
		std::lock_guard<std::mutex> lck(mu);
		return peak_total;
	}
	idx_t GetUpdateCount() const {
		std::lock_guard<std::mutex> lck(mu);
		return update_count;
	}

private:
	mutable std::mutex mu;
	int64_t delta_sum = 0;
	idx_t last_total = 0;
	idx_t peak_total = 0;
	idx_t update_count = 0;
};

// Small pools and short backoffs, so that tests finish quickly.
inline ExchangeClientConfig MakeTestConfig() {
	ExchangeClientConfig config;
	config.min_error_duration = std::chrono::milliseconds(5);
	config.max_error_duration = std::chrono::seconds(5);
	config.max_callback_threads = 4;
	config.max_io_threads = 8;
	return config;
}

// Poll `predicate` until it holds or `timeout` passed.
inline bool WaitFor(const std::function<bool()> &predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!predicate()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
	return true;
}

// Poll every page until the client finished. Stops early on timeout; PollPage exceptions propagate.
inline vector<string> DrainExchangeClient(ExchangeClient &client,
                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
	vector<string> pages;
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		auto result = client.PollPage();
		if (result.type == ExchangePollResultType::FINISHED) {
			break;
		}
		if (result.type == ExchangePollResultType::NOT_READY) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
			continue;
		}
		pages.emplace_back(result.page->GetData());
	}
	return pages;
}

// Splits a page made by FakePageSource::MakePage into its source name and index.
inline std::pair<string, idx_t> ParsePage(const string &page) {
	auto name_end = page.find(':');
	auto index_end = page.find(':', name_end + 1);
	return std::make_pair(page.substr(0, name_end),
	                      static_cast<idx_t>(std::stoull(page.substr(name_end + 1, index_end - name_end - 1))));
}

} // namespace duckdb
