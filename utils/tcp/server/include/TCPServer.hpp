#pragma once

#include <netinet/in.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "custom_exceptions.hpp"
#include "logger.hpp"

// Accepts connections on a background thread and runs the handler for each
// client on its own thread. stop() closes the listener and waits until every
// running handler has returned.
class TCPServer {
   public:
	using Handler = std::function<void(int client_fd)>;

	// Port 0 binds an ephemeral port, see port().
	TCPServer(uint16_t port, Logger& logger, size_t backlog = 16);
	~TCPServer();

	void start(const Handler& handler);

	void stop();

	uint16_t port() const { return port_; }

   private:
	void acceptLoop(const Handler& handler);

	uint16_t port_;
	int listen_fd_;
	size_t backlog_;
	std::atomic<bool> running_;
	Logger& logger_;
	std::thread accept_thread_;

	std::mutex clients_mutex_;
	std::condition_variable clients_done_;
	size_t active_clients_;
};
