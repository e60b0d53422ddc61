#pragma once

#include <string>
#include <cstdint>
#include "TCPClient.hpp"
#include "logger.hpp"

namespace client {

// Exit codes of texbox-client.
constexpr int EXIT_OK = 0;
constexpr int EXIT_COMPILE_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_REJECTED = 3;
constexpr int EXIT_SERVER_ERROR = 4;

class ClientApp {
public:
	ClientApp(const std::string& host, uint16_t port, Logger& logger);

	// Sends path (and the optional assets archive) for compilation. The
	// artifact is written to output_path, or to the name chosen by the server
	// when output_path is empty.
	int compile(const std::string& path, const std::string& assets_path, const std::string& output_path);

	int ping();

private:
	std::string host_;
	uint16_t    port_;
	Logger&     logger_;
};

}
