#include "client.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

#include "custom_exceptions.hpp"
#include "protocol.hpp"

namespace client {

namespace fs = std::filesystem;

static bool read_file(const std::string& path_str, std::vector<uint8_t>& out, Logger& logger) {
	fs::path path(path_str);
	if (!fs::exists(path) || !fs::is_regular_file(path)) {
		logger.error("File does not exist or is not a regular file: " + path_str);
		std::cerr << "Error: File does not exist or is not a regular file: " << path_str << std::endl;
		return false;
	}

	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) {
		logger.error("Failed to open file: " + path_str);
		std::cerr << "Error: Failed to open file: " << path_str << std::endl;
		return false;
	}
	out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
	return true;
}

ClientApp::ClientApp(const std::string& host, uint16_t port, Logger& logger)
    : host_(host), port_(port), logger_(logger) {}

int ClientApp::ping() {
	TCPClient conn(host_, port_, logger_);
	conn.connect();
	conn.send(std::string(protocol::CMD_PING));
	std::string reply = conn.receive_text();
	conn.close();

	if (reply != protocol::REPLY_OK) {
		std::cerr << "Server replied '" << reply << "' to PING" << std::endl;
		return EXIT_SERVER_ERROR;
	}
	std::cout << "ok" << std::endl;
	return EXIT_OK;
}

int ClientApp::compile(const std::string& path, const std::string& assets_path, const std::string& output_path) {
	std::vector<uint8_t> source;
	if (!read_file(path, source, logger_)) {
		return EXIT_USAGE;
	}
	std::vector<uint8_t> assets;
	if (!assets_path.empty() && !read_file(assets_path, assets, logger_)) {
		return EXIT_USAGE;
	}

	TCPClient conn(host_, port_, logger_);
	conn.connect();

	std::string filename_only = fs::path(path).filename().string();
	conn.send(std::string(protocol::CMD_COMPILE));
	conn.send(filename_only);
	conn.send(source);
	conn.send(std::string(assets_path.empty() ? protocol::ARCHIVE_NONE : protocol::ARCHIVE_ATTACHED));
	conn.send(assets);

	std::string status = conn.receive_text();

	if (status == protocol::REPLY_SUCCESS) {
		std::string media_type = conn.receive_text();
		std::string artifact_name = conn.receive_text();
		std::vector<uint8_t> artifact = conn.receive();
		conn.close();

		// The server-chosen name is never trusted as a path.
		std::string target = output_path.empty() ? fs::path(artifact_name).filename().string() : output_path;
		if (target.empty() || target == "." || target == "..") {
			target = fs::path(filename_only).stem().string() + ".pdf";
		}

		std::ofstream ofs(target, std::ios::binary);
		if (!ofs) {
			logger_.error("Failed to create output file: " + target);
			std::cerr << "Error: Failed to create output file: " << target << std::endl;
			return EXIT_USAGE;
		}
		ofs.write(reinterpret_cast<const char*>(artifact.data()), artifact.size());
		ofs.close();
		std::cout << "Received " << media_type << ": " << target << " (" << artifact.size() << " bytes)" << std::endl;
		logger_.info("Received compiled file: " + target + " (size: " + std::to_string(artifact.size()) + " bytes)");
		return EXIT_OK;
	}

	if (status == protocol::REPLY_FAILURE) {
		std::string reason = conn.receive_text();
		std::string exit_code = conn.receive_text();
		std::string message = conn.receive_text();
		std::string out = conn.receive_text();
		std::string err = conn.receive_text();
		conn.close();

		std::cerr << "Compilation failed (" << reason << (exit_code.empty() ? "" : ", exit code " + exit_code)
		          << "): " << message << std::endl;
		if (!out.empty()) {
			std::cerr << "--- stdout ---\n" << out << std::endl;
		}
		if (!err.empty()) {
			std::cerr << "--- stderr ---\n" << err << std::endl;
		}
		logger_.error("Server reported " + reason + " for " + filename_only);
		return EXIT_COMPILE_FAILED;
	}

	if (status == protocol::REPLY_REJECTED) {
		std::string message = conn.receive_text();
		conn.close();
		std::cerr << "Request rejected: " << message << std::endl;
		return EXIT_REJECTED;
	}

	conn.close();
	std::cerr << "Server error: " << status << std::endl;
	logger_.error("Server replied '" + status + "' for " + filename_only);
	return EXIT_SERVER_ERROR;
}

}  // namespace client
