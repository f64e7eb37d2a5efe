/*
 * Exchange Page Server Main Entry Point
 *
 * This executable starts a standalone page buffer server that:
 * - Creates a number of output buffers filled with synthetic pages
 * - Serves them to exchange clients over Arrow Flight
 * - Releases pages as consumers acknowledge them
 *
 * Usage:
 *   ./page_server [host] [port] [buffer_count] [pages_per_buffer] [page_size]
 *
 * Arguments:
 *   host             - Host address to bind to (default: 0.0.0.0)
 *   port             - Port to listen on (default: 8817)
 *   buffer_count     - Number of output buffers, named buffer-0 ... (default: 2)
 *   pages_per_buffer - Pages in every buffer (default: 16)
 *   page_size        - Size of every page, for example 64KB or 1MB (default: 64KB)
 *
 * Examples:
 *   ./page_server                               # 2 buffers of 16 x 64KB pages on 0.0.0.0:8817
 *   ./page_server 0.0.0.0 8818 4 100 1MB        # 4 buffers of 100 x 1MB pages
 *
 * Note:
 *   - Buffers are removed once a consumer read them to the end
 *   - Read them with ./exchange_fetch 32MB grpc://localhost:8817/buffer-0 grpc://localhost:8817/buffer-1
 */

#include <csignal>
#include <iostream>
#include <memory>

#include "duckdb/common/string_util.hpp"
#include "duckdb/main/config.hpp"
#include "transport/page_buffer_server.hpp"

using namespace duckdb;

namespace {
std::unique_ptr<PageBufferServer> g_server;

void SignalHandler(int signal) {
	std::cout << "Received signal " << signal << ", shutting down page server..." << std::endl;
	if (g_server) {
		g_server->Shutdown();
	}
	exit(0);
}
} // namespace

int main(int argc, char *argv[]) {
	std::string host = "0.0.0.0";
	int port = 8817;
	idx_t buffer_count = 2;
	idx_t pages_per_buffer = 16;
	string page_size_str = "64KB";

	if (argc > 1) {
		host = argv[1];
	}
	if (argc > 2) {
		port = std::stoi(argv[2]);
	}
	if (argc > 3) {
		buffer_count = std::stoull(argv[3]);
	}
	if (argc > 4) {
		pages_per_buffer = std::stoull(argv[4]);
	}
	if (argc > 5) {
		page_size_str = argv[5];
	}

	signal(SIGINT, SignalHandler);
	signal(SIGTERM, SignalHandler);

	try {
		auto page_size = DBConfig::ParseMemoryLimit(page_size_str);

		std::cout << "Starting Exchange Page Server" << std::endl;
		std::cout << "Host: " << host << std::endl;
		std::cout << "Port: " << port << std::endl;
		std::cout << "Buffers: " << buffer_count << " x " << pages_per_buffer << " pages of " << page_size
		          << " bytes" << std::endl;

		g_server = std::make_unique<PageBufferServer>(host, port);
		auto status = g_server->Start();
		if (!status.ok()) {
			std::cerr << "Failed to start page server: " << status.ToString() << std::endl;
			return 1;
		}

		for (idx_t buffer_idx = 0; buffer_idx < buffer_count; ++buffer_idx) {
			auto buffer_id = StringUtil::Format("buffer-%llu", buffer_idx);
			g_server->CreateBuffer(buffer_id);
			for (idx_t page_idx = 0; page_idx < pages_per_buffer; ++page_idx) {
				g_server->AddPage(buffer_id, string(page_size, static_cast<char>('a' + page_idx % 26)));
			}
			g_server->SetNoMorePages(buffer_id);
			std::cout << "Serving " << g_server->GetBufferLocation(buffer_id).ToString() << std::endl;
		}

		std::cout << "Press Ctrl+C to stop" << std::endl;
		auto serve_status = g_server->Serve();
		if (!serve_status.ok()) {
			std::cerr << "Page server error: " << serve_status.ToString() << std::endl;
			return 1;
		}
	} catch (const std::exception &ex) {
		std::cerr << "Fatal error: " << ex.what() << std::endl;
		return 1;
	}

	return 0;
}
