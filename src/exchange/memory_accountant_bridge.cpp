#include "exchange/memory_accountant_bridge.hpp"

namespace duckdb {

MemoryAccountantBridge::MemoryAccountantBridge(std::shared_ptr<SystemMemoryUsageListener> listener_p)
    : listener(std::move(listener_p)) {
}

void MemoryAccountantBridge::Report(idx_t buffered_bytes) {
	if (buffered_bytes == reported_bytes) {
		return;
	}
	auto delta = static_cast<int64_t>(buffered_bytes) - static_cast<int64_t>(reported_bytes);
	reported_bytes = buffered_bytes;
	if (listener) {
		listener->UpdateSystemMemoryUsage(delta, buffered_bytes);
	}
}

} // namespace duckdb
