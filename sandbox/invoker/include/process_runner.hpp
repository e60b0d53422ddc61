#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "custom_exceptions.hpp"
#include "logger.hpp"

namespace texbox {

struct ProcessSpec {
	std::vector<std::string> argv;
	std::filesystem::path work_dir;
	// Added to (or replacing entries of) the parent environment. TEXBOX_RUN_ID
	// is reserved.
	std::vector<std::pair<std::string, std::string>> env;
	std::chrono::milliseconds timeout{0};
	std::chrono::milliseconds kill_grace{0};
	size_t max_capture_bytes = 0;
};

struct ProcessOutcome {
	bool timed_out = false;
	int exit_code = -1;
	int term_signal = 0;
	std::string stdout_text;
	std::string stderr_text;
	bool stdout_truncated = false;
	bool stderr_truncated = false;
	std::chrono::milliseconds elapsed{0};
};

// Looks name up the way a shell would: names containing a slash are taken as
// paths (relative ones against the current directory), anything else is
// searched in PATH. Returns an empty path when nothing executable is found.
std::filesystem::path resolve_executable(const std::string& name);

// Runs argv in its own process group with work_dir as cwd and stdin bound to
// /dev/null, capturing stdout and stderr. When the deadline passes the whole
// group is killed with SIGKILL and the leader reaped before returning, so
// the call never outlives timeout + kill_grace by more than scheduling noise.
// Members of the group still running after the leader exits are killed too,
// as are descendants that moved to a session or group of their own: they are
// recognized by a TEXBOX_RUN_ID entry in their environment. Only 0-2 are
// inherited; every other descriptor of the calling process is closed.
//
// Throws ProcessException when the process cannot be started at all.
ProcessOutcome run_process(const ProcessSpec& spec, Logger& logger);

}  // namespace texbox
