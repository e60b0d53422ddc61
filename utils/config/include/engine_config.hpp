#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "custom_exceptions.hpp"
#include "logger.hpp"

namespace texbox {

constexpr auto DEFAULT_ENGINE = "tectonic";
constexpr int DEFAULT_TIMEOUT_SECONDS = 60;
constexpr auto DEFAULT_MAIN_FILENAME = "main.tex";
constexpr auto DEFAULT_CACHE_DIR = "/tmp/tectonic-cache";
constexpr int64_t DEFAULT_KILL_GRACE_MS = 2000;
constexpr size_t DEFAULT_MAX_CAPTURE_BYTES = 4 * 1024 * 1024;
constexpr uint16_t DEFAULT_SERVER_PORT = 5555;
constexpr size_t DEFAULT_MAX_REQUEST_BYTES = 20 * 1024 * 1024;
constexpr auto DEFAULT_LOG_FILE = "texboxd.log";

constexpr auto ARTIFACT_EXTENSION = ".pdf";
constexpr auto ARTIFACT_MEDIA_TYPE = "application/pdf";

// Process-wide settings, read once at startup and then only passed around by
// const reference. Nothing in the sandbox reads the environment on its own.
struct EngineConfig {
	std::string engine = DEFAULT_ENGINE;
	std::chrono::seconds timeout{DEFAULT_TIMEOUT_SECONDS};
	std::string main_filename = DEFAULT_MAIN_FILENAME;
	std::filesystem::path cache_dir = DEFAULT_CACHE_DIR;

	std::filesystem::path work_root;
	std::chrono::milliseconds kill_grace{DEFAULT_KILL_GRACE_MS};
	size_t max_capture_bytes = DEFAULT_MAX_CAPTURE_BYTES;

	uint16_t port = DEFAULT_SERVER_PORT;
	size_t max_request_bytes = DEFAULT_MAX_REQUEST_BYTES;
	LogLevel log_level = LogLevel::INFO;
	std::string log_file = DEFAULT_LOG_FILE;

	bool is_tectonic() const;

	// Name of the variable through which the engine finds its cache directory.
	std::string cache_env_var() const;

	std::string artifact_filename() const;

	std::vector<std::string> build_command(const std::filesystem::path& work_dir) const;
};

using EnvLookup = std::function<const char*(const char* name)>;

EngineConfig load_engine_config(const EnvLookup& lookup);
EngineConfig load_engine_config();

// Creates the cache directory if needed; the engine owns its contents.
void prepare_cache_dir(const EngineConfig& config, Logger& logger);

}  // namespace texbox
