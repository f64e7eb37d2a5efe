#pragma once

#include "duckdb/common/typedefs.hpp"

#include <cstdint>
#include <memory>

namespace duckdb {

// External listener performing cluster-wide memory accounting.
class SystemMemoryUsageListener {
public:
	virtual ~SystemMemoryUsageListener() = default;

	// Called on every net change of the bytes buffered by one exchange client.
	// Invoked with the client's lock held, so it must not call back into the client. Must not throw.
	virtual void UpdateSystemMemoryUsage(int64_t delta_bytes, idx_t total_bytes) = 0;
};

// Forwards buffered byte changes of one exchange client to the listener.
class MemoryAccountantBridge {
public:
	// `listener_p` may be null, in which case changes are only tracked.
	explicit MemoryAccountantBridge(std::shared_ptr<SystemMemoryUsageListener> listener_p);

	// Report the new buffered byte total; nothing is forwarded when it did not change.
	void Report(idx_t buffered_bytes);

	idx_t GetReportedBytes() const {
		return reported_bytes;
	}

private:
	std::shared_ptr<SystemMemoryUsageListener> listener;
	idx_t reported_bytes = 0;
};

} // namespace duckdb
