#include "exchange/page_buffer.hpp"

#include "duckdb/common/assert.hpp"
#include "duckdb/common/helper.hpp"

namespace duckdb {

PageBuffer::PageBuffer(idx_t max_buffered_bytes_p) : max_buffered_bytes(max_buffered_bytes_p) {
}

idx_t PageBuffer::Enqueue(vector<unique_ptr<SerializedPage>> new_pages) {
	idx_t added_bytes = 0;
	for (auto &page : new_pages) {
		D_ASSERT(page);
		added_bytes += page->SizeInBytes();
		pages.emplace_back(std::move(page));
	}
	buffered_bytes += added_bytes;
	peak_buffered_bytes = MaxValue<idx_t>(peak_buffered_bytes, buffered_bytes);
	return added_bytes;
}

unique_ptr<SerializedPage> PageBuffer::Poll() {
	if (pages.empty()) {
		return nullptr;
	}
	auto page = std::move(pages.front());
	pages.pop_front();
	D_ASSERT(buffered_bytes >= page->SizeInBytes());
	buffered_bytes -= page->SizeInBytes();
	return page;
}

idx_t PageBuffer::Clear() {
	auto released_bytes = buffered_bytes;
	pages.clear();
	buffered_bytes = 0;
	return released_bytes;
}

} // namespace duckdb
