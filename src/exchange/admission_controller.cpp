#include "exchange/admission_controller.hpp"

#include "duckdb/common/helper.hpp"

namespace duckdb {

namespace {

bool IsEligible(const SourceSlot &slot, ExchangeClock::time_point now) {
	if (slot.GetStatus() != SourceStatus::RUNNING) {
		return false;
	}
	// Not created yet, the first admission creates the puller.
	if (!slot.puller) {
		return true;
	}
	return slot.puller->CanFetch(now);
}

} // namespace

AdmissionController::AdmissionController(idx_t concurrent_request_multiplier_p, idx_t max_response_size_p)
    : concurrent_request_multiplier(concurrent_request_multiplier_p), max_response_size(max_response_size_p) {
}

idx_t AdmissionController::GetAdmissionCount(const PageBuffer &buffer, idx_t location_count,
                                             idx_t outstanding_requests) const {
	if (buffer.IsFull()) {
		return 0;
	}
	auto max_outstanding = GetMaxOutstandingRequests(location_count);
	if (outstanding_requests >= max_outstanding) {
		return 0;
	}

	// Bytes the buffer may reach once every outstanding and admitted response arrived.
	auto byte_limit = buffer.GetMaxBufferedBytes() + max_response_size;
	auto reserved_bytes = buffer.GetBufferedBytes() + outstanding_requests * max_response_size;
	idx_t fitting_requests = 0;
	if (reserved_bytes < byte_limit) {
		fitting_requests = (byte_limit - reserved_bytes) / MaxValue<idx_t>(max_response_size, 1);
	}
	if (outstanding_requests == 0) {
		fitting_requests = MaxValue<idx_t>(fitting_requests, 1);
	}
	return MinValue<idx_t>(fitting_requests, max_outstanding - outstanding_requests);
}

vector<idx_t> AdmissionController::SelectSources(const vector<SourceSlot> &slots, idx_t count,
                                                 ExchangeClock::time_point now) {
	vector<idx_t> selected;
	if (slots.empty() || count == 0) {
		return selected;
	}
	auto start = next_source % slots.size();
	for (idx_t offset = 0; offset < slots.size() && selected.size() < count; ++offset) {
		auto idx = (start + offset) % slots.size();
		if (IsEligible(slots[idx], now)) {
			selected.emplace_back(idx);
		}
	}
	if (!selected.empty()) {
		next_source = selected.back() + 1;
	}
	return selected;
}

} // namespace duckdb
