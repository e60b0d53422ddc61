#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "TCPServer.hpp"
#include "compile_service.hpp"
#include "engine_config.hpp"
#include "server.hpp"
#include "test_support.hpp"

// Runs texboxd's request handler on an ephemeral port with a shell script
// standing in for the engine. "FAIL" in the source makes it exit 1, "NOPDF"
// makes it exit 0 without output, anything else is copied into main.pdf.
class ServerFixture : public ::testing::Test {
   protected:
	void SetUp() override {
		using namespace std::chrono_literals;
		config_.engine = write_script(bin_.path() / "pdflatex",
		                              "if grep -q FAIL main.tex; then echo '! Emergency stop.'; exit 1; fi\n"
		                              "if grep -q NOPDF main.tex; then exit 0; fi\n"
		                              "{ echo '%PDF-1.5'; cat main.tex; } > main.pdf\n")
		                     .string();
		config_.timeout = 5s;
		config_.kill_grace = 500ms;
		config_.cache_dir = dir_.path() / "cache";
		config_.work_root = dir_.path() / "work";
		config_.port = 0;
		config_.max_request_bytes = 1024 * 1024;

		service_ = std::make_unique<texbox::CompileService>(config_, logger_);
		server_ = std::make_unique<TCPServer>(config_.port, logger_);
		server_->start([this](int fd) { texbox::handle_client(fd, *service_, config_, logger_); });
	}

	void TearDown() override { server_->stop(); }

	uint16_t port() const { return server_->port(); }

	TempDir dir_;
	TempDir bin_;
	texbox::EngineConfig config_;
	Logger logger_ = quiet_logger();
	std::unique_ptr<texbox::CompileService> service_;
	std::unique_ptr<TCPServer> server_;
};
