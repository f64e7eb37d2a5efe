#include "transport/flight_page_source.hpp"

#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"

#include <arrow/buffer.h>
#include <limits>

namespace duckdb {

namespace {
// gRPC channel argument bounding a single received message.
constexpr const char *GRPC_MAX_RECEIVE_MESSAGE_LENGTH = "grpc.max_receive_message_length";
} // namespace

FlightPageSource::FlightPageSource(RemoteLocation location_p, idx_t max_content_length_p)
    : location(std::move(location_p)), max_content_length(max_content_length_p) {
}

arrow::Status FlightPageSource::EnsureConnected(arrow::flight::FlightClient *&flight_client) {
	std::lock_guard<std::mutex> lck(connect_mutex);
	if (!client) {
		arrow::flight::Location flight_location;
		ARROW_ASSIGN_OR_RAISE(flight_location, arrow::flight::Location::Parse(location.uri));

		auto options = arrow::flight::FlightClientOptions::Defaults();
		auto receive_limit = MinValue<idx_t>(max_content_length, static_cast<idx_t>(std::numeric_limits<int>::max()));
		options.generic_options.emplace_back(GRPC_MAX_RECEIVE_MESSAGE_LENGTH, static_cast<int>(receive_limit));
		ARROW_ASSIGN_OR_RAISE(client, arrow::flight::FlightClient::Connect(flight_location, options));
	}
	flight_client = client.get();
	return arrow::Status::OK();
}

arrow::Status FlightPageSource::SendAction(const exchange::ExchangeRequest &req, exchange::ExchangeResponse &resp,
                                           bool cancellable) {
	arrow::flight::FlightClient *flight_client = nullptr;
	ARROW_RETURN_NOT_OK(EnsureConnected(flight_client));

	arrow::flight::FlightCallOptions call_options;
	if (cancellable) {
		call_options.stop_token = stop_source.token();
		ARROW_RETURN_NOT_OK(call_options.stop_token.Poll());
	}

	arrow::flight::Action action {EXCHANGE_ACTION_TYPE, arrow::Buffer::FromString(req.SerializeAsString())};
	std::unique_ptr<arrow::flight::ResultStream> result_stream;
	ARROW_ASSIGN_OR_RAISE(result_stream, flight_client->DoAction(call_options, action));

	std::unique_ptr<arrow::flight::Result> result;
	ARROW_ASSIGN_OR_RAISE(result, result_stream->Next());
	if (!result) {
		return arrow::Status::IOError(StringUtil::Format("No response from exchange source %s", location.ToString()));
	}
	if (!resp.ParseFromArray(result->body->data(), static_cast<int>(result->body->size()))) {
		return arrow::Status::Invalid(
		    StringUtil::Format("Failed to parse ExchangeResponse from %s", location.ToString()));
	}

	if (!resp.success()) {
		return arrow::Status::IOError(
		    StringUtil::Format("Exchange source %s returned an error: %s", location.ToString(), resp.error_message()));
	}
	return arrow::Status::OK();
}

arrow::Status FlightPageSource::GetPages(idx_t token, idx_t max_size_in_bytes, PagesResponse &response) {
	exchange::ExchangeRequest req;
	auto *get_pages_req = req.mutable_get_pages();
	get_pages_req->set_buffer_id(location.buffer_id);
	get_pages_req->set_token(token);
	get_pages_req->set_max_size_in_bytes(max_size_in_bytes);

	exchange::ExchangeResponse resp;
	ARROW_RETURN_NOT_OK(SendAction(req, resp, /*cancellable=*/true));
	if (!resp.has_get_pages()) {
		return arrow::Status::Invalid(
		    StringUtil::Format("Exchange source %s answered GetPages without pages", location.ToString()));
	}

	auto &get_pages_resp = resp.get_pages();
	response.token = get_pages_resp.token();
	response.next_token = get_pages_resp.next_token();
	response.buffer_complete = get_pages_resp.buffer_complete();
	response.pages.clear();
	response.pages.reserve(get_pages_resp.pages_size());
	for (const auto &page : get_pages_resp.pages()) {
		response.pages.emplace_back(make_uniq<SerializedPage>(page));
	}
	return arrow::Status::OK();
}

arrow::Status FlightPageSource::Acknowledge(idx_t token) {
	exchange::ExchangeRequest req;
	auto *ack_req = req.mutable_acknowledge();
	ack_req->set_buffer_id(location.buffer_id);
	ack_req->set_token(token);

	exchange::ExchangeResponse resp;
	return SendAction(req, resp, /*cancellable=*/true);
}

arrow::Status FlightPageSource::Abort() {
	exchange::ExchangeRequest req;
	req.mutable_abort()->set_buffer_id(location.buffer_id);

	exchange::ExchangeResponse resp;
	return SendAction(req, resp, /*cancellable=*/false);
}

void FlightPageSource::Cancel() {
	stop_source.RequestStop(
	    arrow::Status::Cancelled(StringUtil::Format("Exchange source %s was closed", location.ToString())));
}

FlightPageSourceFactory::FlightPageSourceFactory(idx_t max_content_length_p)
    : max_content_length(max_content_length_p) {
}

std::shared_ptr<RemotePageSource> FlightPageSourceFactory::CreatePageSource(const RemoteLocation &location) {
	return std::make_shared<FlightPageSource>(location, max_content_length);
}

} // namespace duckdb
