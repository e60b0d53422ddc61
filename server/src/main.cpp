#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <iostream>

#include "compile_service.hpp"
#include "engine_config.hpp"
#include "logger.hpp"
#include "server.hpp"

static std::atomic<bool> server_is_running(true);

void shutdown_handler(int signum) {
	(void)signum;

	server_is_running.store(false);
}

int main() {
	texbox::EngineConfig config;
	try {
		config = texbox::load_engine_config();
	} catch (const ConfigException& e) {
		std::cerr << "texboxd: " << e.what() << std::endl;
		return 2;
	}

	Logger app_logger = Logger::Builder()
	                        .set_log_level(config.log_level)
	                        .add_console_handler()
	                        .add_file_handler(config.log_file)
	                        .build();

	app_logger.info("texboxd starting: engine '" + config.engine + "', timeout " +
	                std::to_string(config.timeout.count()) + " s, main file '" + config.main_filename +
	                "', work root " + config.work_root.string());

	struct sigaction sa;
	sa.sa_handler = shutdown_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;
	if (sigaction(SIGINT, &sa, NULL) == -1) {
		app_logger.error("Failed to set SIGINT handler");
		return 1;
	}
	if (sigaction(SIGTERM, &sa, NULL) == -1) {
		app_logger.error("Failed to set SIGTERM handler");
		return 1;
	}
	signal(SIGPIPE, SIG_IGN);

	try {
		texbox::prepare_cache_dir(config, app_logger);

		texbox::CompileService service(config, app_logger);
		TCPServer tcp_server_instance(config.port, app_logger);
		tcp_server_instance.start([&](int fd) { texbox::handle_client(fd, service, config, app_logger); });

		app_logger.info("texboxd is listening on port " + std::to_string(tcp_server_instance.port()) +
		                ". Waiting for signal to shut down.");

		while (server_is_running.load()) {
			pause();
		}

		app_logger.info("Shutdown signal received. Stopping TCP server listener...");
		tcp_server_instance.stop();

		if (service.workspaces().live_workspaces() != 0) {
			app_logger.warning(std::to_string(service.workspaces().live_workspaces()) + " workspace(s) still live");
		}
	} catch (const SystemException& e) {
		app_logger.critical("texboxd failed: " + std::string(e.what()));
		return 1;
	}

	app_logger.info("texboxd shut down successfully.");
	return 0;
}
