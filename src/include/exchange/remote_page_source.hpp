#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "exchange/serialized_page.hpp"

#include <arrow/status.h>
#include <memory>

namespace duckdb {

// Address of one upstream task's output buffer.
// For example, uri "grpc://worker-1:8816" and buffer id "query_1.stage_2.task_0".
struct RemoteLocation {
	string uri;
	string buffer_id;

	RemoteLocation() = default;
	RemoteLocation(string uri_p, string buffer_id_p) : uri(std::move(uri_p)), buffer_id(std::move(buffer_id_p)) {
	}

	// Formats as "<uri>/<buffer_id>".
	string ToString() const;

	// Parse "<scheme>://<host>:<port>/<buffer_id>".
	// Throws InvalidInputException when the buffer id or the scheme is missing.
	static RemoteLocation Parse(const string &location);

	bool operator==(const RemoteLocation &other) const {
		return uri == other.uri && buffer_id == other.buffer_id;
	}
	bool operator!=(const RemoteLocation &other) const {
		return !(*this == other);
	}
};

// Result of one page request.
struct PagesResponse {
	// Token of the first returned page, which should match the requested token.
	idx_t token = 0;
	// Token to request next.
	idx_t next_token = 0;
	vector<unique_ptr<SerializedPage>> pages;
	// The producer finished the buffer and every page has been handed out.
	bool buffer_complete = false;

	idx_t SizeInBytes() const {
		idx_t total = 0;
		for (auto &page : pages) {
			total += page->SizeInBytes();
		}
		return total;
	}
};

// Client side of a remote page source, one instance per location.
// All calls block until the remote side answers; they may be issued concurrently.
class RemotePageSource {
public:
	virtual ~RemotePageSource() = default;

	// Request the pages starting at `token`, at most `max_size_in_bytes` in total.
	virtual arrow::Status GetPages(idx_t token, idx_t max_size_in_bytes, PagesResponse &response) = 0;

	// Tell the producer every page before `token` has been consumed.
	virtual arrow::Status Acknowledge(idx_t token) = 0;

	// Tell the producer the buffer will not be read again.
	// Must still work after Cancel().
	virtual arrow::Status Abort() = 0;

	// Abort in-flight and future GetPages and Acknowledge calls. Safe to call from any thread.
	virtual void Cancel() = 0;
};

// Creates page sources for locations.
class PageSourceFactory {
public:
	virtual ~PageSourceFactory() = default;

	virtual std::shared_ptr<RemotePageSource> CreatePageSource(const RemoteLocation &location) = 0;

	// Largest response body the transport accepts.
	virtual idx_t GetMaxContentLength() const = 0;
};

} // namespace duckdb
