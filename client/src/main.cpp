#include <getopt.h>

#include <cstdlib>
#include <iostream>

#include "client.hpp"
#include "custom_exceptions.hpp"
#include "logger.hpp"

static Logger app_logger = Logger::Builder().set_log_level(LogLevel::WARNING).add_console_handler().build();

static void print_usage() {
	std::cerr << "Usage: texbox-client [-H host] [-p port] [-o output.pdf] file.tex [assets.zip]\n"
	          << "       texbox-client [-H host] [-p port] --ping\n";
}

int main(int argc, char** argv) {
	std::string host = "127.0.0.1";
	long port = 5555;
	std::string output;
	bool ping = false;

	static const option long_options[] = {{"host", required_argument, nullptr, 'H'},
	                                      {"port", required_argument, nullptr, 'p'},
	                                      {"output", required_argument, nullptr, 'o'},
	                                      {"ping", no_argument, nullptr, 'P'},
	                                      {"help", no_argument, nullptr, 'h'},
	                                      {nullptr, 0, nullptr, 0}};

	int opt;
	while ((opt = getopt_long(argc, argv, "H:p:o:h", long_options, nullptr)) != -1) {
		switch (opt) {
			case 'H':
				host = optarg;
				break;
			case 'p': {
				char* end = nullptr;
				port = std::strtol(optarg, &end, 10);
				if (!*optarg || *end || port <= 0 || port > 65535) {
					std::cerr << "Invalid port: " << optarg << std::endl;
					return client::EXIT_USAGE;
				}
				break;
			}
			case 'o':
				output = optarg;
				break;
			case 'P':
				ping = true;
				break;
			case 'h':
				print_usage();
				return client::EXIT_OK;
			default:
				print_usage();
				return client::EXIT_USAGE;
		}
	}

	int positional = argc - optind;
	if ((ping && positional != 0) || (!ping && (positional < 1 || positional > 2))) {
		print_usage();
		return client::EXIT_USAGE;
	}

	client::ClientApp app(host, static_cast<uint16_t>(port), app_logger);
	try {
		if (ping) {
			return app.ping();
		}
		return app.compile(argv[optind], positional == 2 ? argv[optind + 1] : "", output);
	} catch (const SystemException& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return client::EXIT_SERVER_ERROR;
	}
}
