#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "exchange/memory_accountant_bridge.hpp"
#include "exchange/page_buffer.hpp"

using namespace duckdb; // NOLINT

namespace {

vector<unique_ptr<SerializedPage>> MakePages(std::initializer_list<idx_t> sizes) {
	vector<unique_ptr<SerializedPage>> pages;
	char fill = 'a';
	for (auto size : sizes) {
		pages.emplace_back(make_uniq<SerializedPage>(string(size, fill++)));
	}
	return pages;
}

class DeltaListener : public SystemMemoryUsageListener {
public:
	void UpdateSystemMemoryUsage(int64_t delta_bytes, idx_t total_bytes) override {
		deltas.emplace_back(delta_bytes);
		totals.emplace_back(total_bytes);
	}

	vector<int64_t> deltas;
	vector<idx_t> totals;
};

} // namespace

TEST_CASE("Page buffer keeps pages in order", "[page_buffer]") {
	PageBuffer buffer(100);
	REQUIRE(buffer.IsEmpty());
	REQUIRE(buffer.Poll() == nullptr);

	REQUIRE(buffer.Enqueue(MakePages({10, 20})) == 30);
	REQUIRE(buffer.Enqueue(MakePages({5})) == 5);
	REQUIRE(buffer.GetBufferedBytes() == 35);
	REQUIRE(buffer.GetPageCount() == 3);

	auto first = buffer.Poll();
	REQUIRE(first->SizeInBytes() == 10);
	REQUIRE(first->GetData() == string(10, 'a'));
	REQUIRE(buffer.Poll()->SizeInBytes() == 20);
	REQUIRE(buffer.GetBufferedBytes() == 5);
	REQUIRE(buffer.Poll()->SizeInBytes() == 5);
	REQUIRE(buffer.IsEmpty());
	REQUIRE(buffer.GetBufferedBytes() == 0);
	REQUIRE(buffer.GetPeakBufferedBytes() == 35);
}

TEST_CASE("Page buffer reports full at its ceiling", "[page_buffer]") {
	PageBuffer buffer(100);
	buffer.Enqueue(MakePages({60}));
	REQUIRE_FALSE(buffer.IsFull());
	buffer.Enqueue(MakePages({40}));
	REQUIRE(buffer.IsFull());

	// A response that already arrived is accepted beyond the ceiling.
	REQUIRE(buffer.Enqueue(MakePages({70})) == 70);
	REQUIRE(buffer.GetBufferedBytes() == 170);
	REQUIRE(buffer.GetPeakBufferedBytes() == 170);
	REQUIRE(buffer.GetMaxBufferedBytes() == 100);

	buffer.Poll();
	buffer.Poll();
	REQUIRE(buffer.IsFull());
	buffer.Poll();
	REQUIRE_FALSE(buffer.IsFull());
}

TEST_CASE("Page buffer clear releases every page", "[page_buffer]") {
	PageBuffer buffer(100);
	buffer.Enqueue(MakePages({1, 2, 3}));
	REQUIRE(buffer.Clear() == 6);
	REQUIRE(buffer.IsEmpty());
	REQUIRE(buffer.GetBufferedBytes() == 0);
	REQUIRE(buffer.Clear() == 0);
}

TEST_CASE("Memory accountant bridge forwards net changes", "[page_buffer]") {
	auto listener = std::make_shared<DeltaListener>();
	MemoryAccountantBridge bridge(listener);

	bridge.Report(100);
	bridge.Report(100);
	bridge.Report(40);
	bridge.Report(0);

	REQUIRE(listener->deltas.size() == 3);
	REQUIRE(listener->deltas[0] == 100);
	REQUIRE(listener->deltas[1] == -60);
	REQUIRE(listener->deltas[2] == -40);
	REQUIRE(listener->totals[1] == 40);
	REQUIRE(bridge.GetReportedBytes() == 0);

	SECTION("Without listener") {
		MemoryAccountantBridge silent(nullptr);
		silent.Report(10);
		REQUIRE(silent.GetReportedBytes() == 10);
	}
}
