#include "transport/page_buffer_server.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"
#include "transport/flight_page_source.hpp"

#include <arrow/buffer.h>
#include <chrono>

namespace duckdb {

namespace {
// How long a GetPages request waits for pages before answering with none.
constexpr int PAGE_WAIT_TIMEOUT_MS = 100;
} // namespace

PageBufferServer::PageBufferServer(string host_p, int port_p, DuckDB *shared_db)
    : host(std::move(host_p)), port(port_p) {
	if (shared_db != nullptr) {
		db = shared_db;
	} else {
		owned_db = make_uniq<DuckDB>(/*path=*/nullptr, /*config=*/nullptr);
		db = owned_db.get();
	}
}

arrow::Status PageBufferServer::Start() {
	arrow::flight::Location location;
	ARROW_ASSIGN_OR_RAISE(location, arrow::flight::Location::ForGrpcTcp(host, port));

	arrow::flight::FlightServerOptions options(location);
	ARROW_RETURN_NOT_OK(Init(options));
	// Port 0 binds an ephemeral port.
	port = FlightServerBase::port();

	auto &db_instance = *db->instance.get();
	DUCKDB_LOG_DEBUG(db_instance, StringUtil::Format("Page buffer server started on %s:%d", host, port));
	return arrow::Status::OK();
}

void PageBufferServer::Shutdown() {
	{
		std::lock_guard<std::mutex> lck(buffers_mutex);
		buffers.clear();
	}
	buffers_changed.notify_all();
	[[maybe_unused]] auto status = FlightServerBase::Shutdown();
}

string PageBufferServer::GetLocation() const {
	auto connect_host = host == "0.0.0.0" ? string("localhost") : host;
	return StringUtil::Format("grpc://%s:%d", connect_host, port);
}

RemoteLocation PageBufferServer::GetBufferLocation(const string &buffer_id) const {
	return RemoteLocation(GetLocation(), buffer_id);
}

void PageBufferServer::CreateBuffer(const string &buffer_id) {
	std::lock_guard<std::mutex> lck(buffers_mutex);
	if (buffers.find(buffer_id) != buffers.end()) {
		throw InvalidInputException("Output buffer %s already exists", buffer_id);
	}
	buffers.emplace(buffer_id, OutputBuffer());
}

void PageBufferServer::AddPage(const string &buffer_id, string page) {
	{
		std::lock_guard<std::mutex> lck(buffers_mutex);
		auto &buffer = GetBuffer(buffer_id);
		if (buffer.no_more_pages) {
			throw InvalidInputException("Output buffer %s does not accept pages anymore", buffer_id);
		}
		buffer.pages.emplace_back(std::move(page));
	}
	buffers_changed.notify_all();
}

void PageBufferServer::SetNoMorePages(const string &buffer_id) {
	{
		std::lock_guard<std::mutex> lck(buffers_mutex);
		GetBuffer(buffer_id).no_more_pages = true;
	}
	buffers_changed.notify_all();
}

bool PageBufferServer::HasBuffer(const string &buffer_id) const {
	std::lock_guard<std::mutex> lck(buffers_mutex);
	return buffers.find(buffer_id) != buffers.end();
}

idx_t PageBufferServer::GetAcknowledgedToken(const string &buffer_id) const {
	std::lock_guard<std::mutex> lck(buffers_mutex);
	return GetBuffer(buffer_id).acknowledged_token;
}

idx_t PageBufferServer::GetRetainedPageCount(const string &buffer_id) const {
	std::lock_guard<std::mutex> lck(buffers_mutex);
	return GetBuffer(buffer_id).pages.size();
}

PageBufferServer::OutputBuffer &PageBufferServer::GetBuffer(const string &buffer_id) {
	auto iter = buffers.find(buffer_id);
	if (iter == buffers.end()) {
		throw InvalidInputException("Output buffer %s does not exist", buffer_id);
	}
	return iter->second;
}

const PageBufferServer::OutputBuffer &PageBufferServer::GetBuffer(const string &buffer_id) const {
	auto iter = buffers.find(buffer_id);
	if (iter == buffers.end()) {
		throw InvalidInputException("Output buffer %s does not exist", buffer_id);
	}
	return iter->second;
}

bool PageBufferServer::ReleasePagesBefore(OutputBuffer &buffer, idx_t token) {
	if (token < buffer.first_token || token > buffer.first_token + buffer.pages.size()) {
		return false;
	}
	while (buffer.first_token < token) {
		buffer.pages.pop_front();
		++buffer.first_token;
	}
	buffer.acknowledged_token = MaxValue<idx_t>(buffer.acknowledged_token, token);
	return true;
}

arrow::Status PageBufferServer::DoAction(const arrow::flight::ServerCallContext &context,
                                         const arrow::flight::Action &action,
                                         std::unique_ptr<arrow::flight::ResultStream> *result) {
	if (action.type != EXCHANGE_ACTION_TYPE) {
		return arrow::Status::Invalid(StringUtil::Format("Unknown action type: %s", action.type));
	}
	exchange::ExchangeRequest request;
	if (!request.ParseFromArray(action.body->data(), static_cast<int>(action.body->size()))) {
		return arrow::Status::Invalid("Failed to parse ExchangeRequest");
	}
	++request_count;

	exchange::ExchangeResponse response;
	response.set_success(true);

	switch (request.request_case()) {
	case exchange::ExchangeRequest::kGetPages:
		ARROW_RETURN_NOT_OK(HandleGetPages(request.get_pages(), response));
		break;
	case exchange::ExchangeRequest::kAcknowledge:
		ARROW_RETURN_NOT_OK(HandleAcknowledge(request.acknowledge(), response));
		break;
	case exchange::ExchangeRequest::kAbort:
		ARROW_RETURN_NOT_OK(HandleAbort(request.abort(), response));
		break;
	case exchange::ExchangeRequest::REQUEST_NOT_SET:
		return arrow::Status::Invalid("Request type not set");
	default:
		return arrow::Status::Invalid("Unknown request type");
	}

	std::string response_data = response.SerializeAsString();
	auto buffer = arrow::Buffer::FromString(response_data);

	std::vector<arrow::flight::Result> results;
	results.emplace_back(arrow::flight::Result {buffer});
	*result = std::make_unique<arrow::flight::SimpleResultStream>(std::move(results));

	return arrow::Status::OK();
}

arrow::Status PageBufferServer::HandleGetPages(const exchange::GetPagesRequest &req,
                                               exchange::ExchangeResponse &resp) {
	std::unique_lock<std::mutex> lck(buffers_mutex);
	auto has_buffer = [&]() {
		return buffers.find(req.buffer_id()) != buffers.end();
	};
	if (!has_buffer()) {
		resp.set_success(false);
		resp.set_error_message(StringUtil::Format("Output buffer %s does not exist", req.buffer_id()));
		return arrow::Status::OK();
	}

	// Long poll: wait for the requested page, the end of the buffer or its removal.
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(PAGE_WAIT_TIMEOUT_MS);
	buffers_changed.wait_until(lck, deadline, [&]() {
		if (!has_buffer()) {
			return true;
		}
		auto &buffer = buffers[req.buffer_id()];
		return buffer.no_more_pages || req.token() < buffer.first_token + buffer.pages.size();
	});
	if (!has_buffer()) {
		resp.set_success(false);
		resp.set_error_message(StringUtil::Format("Output buffer %s was aborted", req.buffer_id()));
		return arrow::Status::OK();
	}

	auto &buffer = buffers[req.buffer_id()];
	if (!ReleasePagesBefore(buffer, req.token())) {
		resp.set_success(false);
		resp.set_error_message(StringUtil::Format("Token %llu is outside of output buffer %s [%llu, %llu]",
		                                          static_cast<idx_t>(req.token()), req.buffer_id(), buffer.first_token,
		                                          buffer.first_token + static_cast<idx_t>(buffer.pages.size())));
		return arrow::Status::OK();
	}

	auto *get_pages_resp = resp.mutable_get_pages();
	get_pages_resp->set_token(req.token());
	idx_t response_size = 0;
	idx_t page_count = 0;
	for (auto &page : buffer.pages) {
		// Always return at least one page, so that a single large page still makes progress.
		if (page_count > 0 && response_size + page.size() > req.max_size_in_bytes()) {
			break;
		}
		get_pages_resp->add_pages(page);
		response_size += page.size();
		++page_count;
	}
	auto next_token = buffer.first_token + page_count;
	get_pages_resp->set_next_token(next_token);
	get_pages_resp->set_buffer_complete(buffer.no_more_pages && next_token == buffer.first_token + buffer.pages.size());
	return arrow::Status::OK();
}

arrow::Status PageBufferServer::HandleAcknowledge(const exchange::AcknowledgeRequest &req,
                                                  exchange::ExchangeResponse &resp) {
	std::lock_guard<std::mutex> lck(buffers_mutex);
	resp.mutable_acknowledge();
	auto iter = buffers.find(req.buffer_id());
	if (iter == buffers.end()) {
		// Acknowledging a removed buffer is harmless.
		return arrow::Status::OK();
	}
	auto &buffer = iter->second;
	if (req.token() <= buffer.first_token) {
		return arrow::Status::OK();
	}
	if (!ReleasePagesBefore(buffer, req.token())) {
		resp.set_success(false);
		resp.set_error_message(StringUtil::Format("Cannot acknowledge token %llu of output buffer %s",
		                                          static_cast<idx_t>(req.token()), req.buffer_id()));
	}
	return arrow::Status::OK();
}

arrow::Status PageBufferServer::HandleAbort(const exchange::AbortRequest &req, exchange::ExchangeResponse &resp) {
	{
		std::lock_guard<std::mutex> lck(buffers_mutex);
		resp.mutable_abort();
		buffers.erase(req.buffer_id());
	}
	buffers_changed.notify_all();

	auto &db_instance = *db->instance.get();
	DUCKDB_LOG_DEBUG(db_instance, StringUtil::Format("Output buffer %s removed", req.buffer_id()));
	return arrow::Status::OK();
}

} // namespace duckdb
