#include "engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace texbox {

namespace {

std::string lower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

bool read_var(const EnvLookup& lookup, const char* name, std::string& out) {
	const char* value = lookup(name);
	if (!value || !*value) {
		return false;
	}
	out = value;
	return true;
}

uint64_t parse_unsigned(const char* name, const std::string& value, uint64_t min, uint64_t max) {
	if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw ConfigException(std::string(name) + " must be a non-negative integer, got '" + value + "'");
	}

	errno = 0;
	unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
	if (errno == ERANGE || parsed < min || parsed > max) {
		throw ConfigException(std::string(name) + " must be between " + std::to_string(min) + " and " +
		                      std::to_string(max) + ", got '" + value + "'");
	}
	return parsed;
}

}  // namespace

bool EngineConfig::is_tectonic() const { return lower(fs::path(engine).filename().string()) == "tectonic"; }

std::string EngineConfig::cache_env_var() const { return is_tectonic() ? "TECTONIC_CACHE_DIR" : "TEXMFVAR"; }

std::string EngineConfig::artifact_filename() const {
	return fs::path(main_filename).stem().string() + ARTIFACT_EXTENSION;
}

std::vector<std::string> EngineConfig::build_command(const fs::path& work_dir) const {
	if (is_tectonic()) {
		return {engine, "--synctex=0", "--keep-intermediates", "--keep-logs", "--outdir", work_dir.string(),
		        main_filename};
	}
	return {engine, "-interaction=nonstopmode", "-halt-on-error", "-output-directory", work_dir.string(),
	        main_filename};
}

EngineConfig load_engine_config(const EnvLookup& lookup) {
	EngineConfig config;
	std::string value;

	if (read_var(lookup, "LATEX_ENGINE", value)) {
		config.engine = value;
	}
	if (read_var(lookup, "LATEX_TIMEOUT_SECONDS", value)) {
		config.timeout = std::chrono::seconds(parse_unsigned("LATEX_TIMEOUT_SECONDS", value, 1, 24 * 3600));
	}
	if (read_var(lookup, "LATEX_MAIN_FILENAME", value)) {
		if (value == "." || value == ".." || value.find('/') != std::string::npos ||
		    value.find('\\') != std::string::npos) {
			throw ConfigException("LATEX_MAIN_FILENAME must be a plain file name, got '" + value + "'");
		}
		config.main_filename = value;
	}
	if (read_var(lookup, "TECTONIC_CACHE_DIR", value)) {
		config.cache_dir = value;
	}

	if (read_var(lookup, "TEXBOX_WORK_ROOT", value)) {
		config.work_root = value;
	} else {
		std::error_code ec;
		config.work_root = fs::temp_directory_path(ec);
		if (ec) {
			config.work_root = "/tmp";
		}
	}
	if (read_var(lookup, "TEXBOX_KILL_GRACE_MS", value)) {
		config.kill_grace = std::chrono::milliseconds(parse_unsigned("TEXBOX_KILL_GRACE_MS", value, 0, 60 * 1000));
	}
	if (read_var(lookup, "TEXBOX_MAX_CAPTURE_BYTES", value)) {
		config.max_capture_bytes = static_cast<size_t>(
		    parse_unsigned("TEXBOX_MAX_CAPTURE_BYTES", value, 1024, std::numeric_limits<uint32_t>::max()));
	}
	if (read_var(lookup, "TEXBOX_PORT", value)) {
		config.port = static_cast<uint16_t>(parse_unsigned("TEXBOX_PORT", value, 0, 65535));
	}
	if (read_var(lookup, "TEXBOX_MAX_REQUEST_BYTES", value)) {
		config.max_request_bytes = static_cast<size_t>(
		    parse_unsigned("TEXBOX_MAX_REQUEST_BYTES", value, 1, std::numeric_limits<uint32_t>::max()));
	}
	if (read_var(lookup, "TEXBOX_LOG_LEVEL", value)) {
		if (!parse_log_level(value, config.log_level)) {
			throw ConfigException("TEXBOX_LOG_LEVEL has unknown level '" + value + "'");
		}
	}
	if (read_var(lookup, "TEXBOX_LOG_FILE", value)) {
		config.log_file = value;
	}

	return config;
}

EngineConfig load_engine_config() {
	return load_engine_config([](const char* name) { return std::getenv(name); });
}

void prepare_cache_dir(const EngineConfig& config, Logger& logger) {
	std::error_code ec;
	fs::create_directories(config.cache_dir, ec);
	if (ec) {
		logger.error("Cannot create engine cache directory " + config.cache_dir.string() + ": " + ec.message());
		throw ConfigException("cannot create cache directory " + config.cache_dir.string());
	}
	logger.info("Engine cache directory: " + config.cache_dir.string());
}

}  // namespace texbox
