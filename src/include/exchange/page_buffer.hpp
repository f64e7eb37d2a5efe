#pragma once

#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "exchange/serialized_page.hpp"

#include <deque>

namespace duckdb {

// Byte-accounted FIFO of fetched but not yet consumed pages.
// Not thread safe, the owning exchange client serializes access.
class PageBuffer {
public:
	explicit PageBuffer(idx_t max_buffered_bytes_p);

	// Appends the pages in order and returns the added bytes.
	// Always accepts the pages, even when that overshoots the ceiling, since the response already arrived.
	idx_t Enqueue(vector<unique_ptr<SerializedPage>> pages);

	// Returns nullptr when the buffer is empty.
	unique_ptr<SerializedPage> Poll();

	// Drops every buffered page and returns the released bytes.
	idx_t Clear();

	// Whether buffered bytes reached the ceiling.
	bool IsFull() const {
		return buffered_bytes >= max_buffered_bytes;
	}
	bool IsEmpty() const {
		return pages.empty();
	}
	idx_t GetBufferedBytes() const {
		return buffered_bytes;
	}
	idx_t GetPageCount() const {
		return pages.size();
	}
	idx_t GetMaxBufferedBytes() const {
		return max_buffered_bytes;
	}
	idx_t GetPeakBufferedBytes() const {
		return peak_buffered_bytes;
	}

private:
	const idx_t max_buffered_bytes;
	std::deque<unique_ptr<SerializedPage>> pages;
	idx_t buffered_bytes = 0;
	idx_t peak_buffered_bytes = 0;
};

} // namespace duckdb
