#include "server.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include "custom_exceptions.hpp"
#include "protocol.hpp"

namespace texbox {

class TCPClientConnection {
   public:
	TCPClientConnection(int fd, size_t max_frame, Logger& log) : fd_(fd), max_frame_(max_frame), log_(log) {}
	~TCPClientConnection() { ::close(fd_); }

	TCPClientConnection(const TCPClientConnection&) = delete;
	TCPClientConnection& operator=(const TCPClientConnection&) = delete;

	std::vector<uint8_t> receive() {
		uint32_t net_size;
		ssize_t recv_bytes = ::recv(fd_, &net_size, sizeof(net_size), MSG_WAITALL);
		if (recv_bytes == 0) throw TransmissionException("Client disconnected while waiting for header.");
		if (recv_bytes != sizeof(net_size)) {
			log_.error("recv header failed: " + std::string(strerror(errno)) + ", received " +
			           std::to_string(recv_bytes));
			throw TransmissionException("recv header failed");
		}
		auto size = ntohl(net_size);
		if (size > max_frame_) {
			log_.error("Declared payload size too large: " + std::to_string(size));
			throw TransmissionException("Declared payload size too large");
		}
		std::vector<uint8_t> buf(size);
		if (size > 0) {
			recv_bytes = ::recv(fd_, buf.data(), size, MSG_WAITALL);
			if (recv_bytes == 0) throw TransmissionException("Client disconnected while waiting for payload.");
			if (recv_bytes != static_cast<ssize_t>(size)) {
				log_.error("recv payload failed: " + std::string(strerror(errno)) + ", received " +
				           std::to_string(recv_bytes) + " expected " + std::to_string(size));
				throw TransmissionException("recv payload failed");
			}
		}
		return buf;
	}

	void send(const std::vector<uint8_t>& data) {
		uint32_t net_size = htonl(data.size());
		send_all(reinterpret_cast<const uint8_t*>(&net_size), sizeof(net_size), "header");
		send_all(data.data(), data.size(), "payload");
	}

	void send(const std::string& text) { send(protocol::to_frame(text)); }

   private:
	void send_all(const uint8_t* data, size_t len, const char* what) {
		while (len > 0) {
			ssize_t sent = ::send(fd_, data, len, MSG_NOSIGNAL);
			if (sent < 0) {
				if (errno == EINTR) continue;
				log_.error(std::string("send ") + what + " failed: " + strerror(errno));
				throw TransmissionException(std::string("send ") + what + " failed");
			}
			data += sent;
			len -= static_cast<size_t>(sent);
		}
	}

	int fd_;
	size_t max_frame_;
	Logger& log_;
};

bool has_source_extension(const std::string& filename) {
	std::string ext = protocol::SOURCE_EXTENSION;
	if (filename.size() <= ext.size()) {
		return false;
	}
	return std::equal(ext.rbegin(), ext.rend(), filename.rbegin(), [](char a, char b) {
		return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
	});
}

static void send_response(TCPClientConnection& conn, const CompileResponse& response) {
	if (response.status == CompileStatus::SUCCESS) {
		conn.send(protocol::REPLY_SUCCESS);
		conn.send(response.artifact.media_type);
		conn.send(response.artifact.filename);
		conn.send(response.artifact.bytes);
		return;
	}

	const Diagnostic& diag = response.diagnostic;
	conn.send(protocol::REPLY_FAILURE);
	conn.send(failure_reason_name(diag.reason));
	conn.send(diag.exit_code >= 0 ? std::to_string(diag.exit_code) : std::string());
	conn.send(diag.message);
	conn.send(diag.stdout_text);
	conn.send(diag.stderr_text);
}

void handle_client(int client_fd, CompileService& service, const EngineConfig& config, Logger& log) {
	log.debug("Handling new client on fd: " + std::to_string(client_fd));
	TCPClientConnection conn(client_fd, config.max_request_bytes, log);

	try {
		std::string cmd = protocol::from_frame(conn.receive());
		log.debug("Received command: " + cmd + " from fd: " + std::to_string(client_fd));

		if (cmd == protocol::CMD_PING) {
			conn.send(protocol::REPLY_OK);
		} else if (cmd == protocol::CMD_COMPILE) {
			std::string filename = protocol::from_frame(conn.receive());
			std::vector<uint8_t> source = conn.receive();
			std::string archive_flag = protocol::from_frame(conn.receive());
			std::vector<uint8_t> archive = conn.receive();

			log.info("Compile request for '" + filename + "' (" + std::to_string(source.size()) + " bytes, assets " +
			         std::to_string(archive.size()) + " bytes) from fd: " + std::to_string(client_fd));

			if (!has_source_extension(filename)) {
				log.warning("Rejected '" + filename + "': not a .tex file");
				conn.send(protocol::REPLY_REJECTED);
				conn.send(std::string("Uploaded file must have a .tex extension."));
				return;
			}
			bool has_archive = archive_flag == protocol::ARCHIVE_ATTACHED;
			if (!has_archive && (archive_flag != protocol::ARCHIVE_NONE || !archive.empty())) {
				log.warning("Rejected '" + filename + "': malformed archive flag '" + archive_flag + "'");
				conn.send(protocol::REPLY_REJECTED);
				conn.send(std::string("Malformed archive flag."));
				return;
			}

			// An attached archive is validated even when it is empty.
			CompileResponse response = service.compile(source, has_archive ? &archive : nullptr);
			send_response(conn, response);
			log.info("Sent " + std::string(response.status == CompileStatus::SUCCESS ? "artifact" : "diagnostic") +
			         " for '" + filename + "' to fd: " + std::to_string(client_fd));
		} else {
			log.warning("Unknown command: '" + cmd + "' from fd: " + std::to_string(client_fd));
			conn.send(protocol::REPLY_UNKNOWN_COMMAND);
		}
	} catch (const TransmissionException& ex) {
		log.warning("TransmissionException for fd=" + std::to_string(client_fd) + ": " + ex.what());
	} catch (const std::exception& ex) {
		log.error("Client handler exception for fd=" + std::to_string(client_fd) + ": " + std::string(ex.what()));
		try {
			conn.send(protocol::REPLY_SERVER_ERROR);
		} catch (const std::exception& send_ex) {
			log.error("Failed to send SERVER_ERROR to client: " + std::string(send_ex.what()));
		}
	}

	log.debug("Finished handling client on fd: " + std::to_string(client_fd));
}

}  // namespace texbox
