#include "result_assembler.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "unique_fd.hpp"

namespace texbox {

namespace {

// Refuses anything that is not a plain file, so an engine cannot hand out a
// link to a file outside the workspace.
bool read_regular_file(const std::filesystem::path& path, std::vector<uint8_t>& out, std::string& error) {
	UniqueFd fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
	if (!fd.valid()) {
		error = errno == ENOENT ? "no such file" : std::strerror(errno);
		return false;
	}

	struct stat st;
	if (::fstat(fd.get(), &st) < 0) {
		error = std::strerror(errno);
		return false;
	}
	if (!S_ISREG(st.st_mode)) {
		error = "not a regular file";
		return false;
	}

	out.resize(static_cast<size_t>(st.st_size));
	size_t done = 0;
	while (done < out.size()) {
		ssize_t n = ::read(fd.get(), out.data() + done, out.size() - done);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			error = std::strerror(errno);
			return false;
		}
		if (n == 0) {
			break;
		}
		done += static_cast<size_t>(n);
	}
	out.resize(done);
	return true;
}

}  // namespace

const char* failure_reason_name(FailureReason reason) {
	switch (reason) {
		case FailureReason::NONZERO_EXIT:
			return "nonzero_exit";
		case FailureReason::TIMEOUT:
			return "timeout";
		case FailureReason::MISSING_ARTIFACT:
			return "missing_artifact";
		case FailureReason::INVALID_ARCHIVE:
			return "invalid_archive";
		default:
			return "unknown";
	}
}

ResultAssembler::ResultAssembler(const EngineConfig& config, Logger& logger) : config_(config), logger_(logger) {}

CompileResponse ResultAssembler::assemble(const CompilationResult& result) {
	CompileResponse response;
	response.diagnostic.stdout_text = result.stdout_text;
	response.diagnostic.stderr_text = result.stderr_text;

	if (result.timed_out) {
		response.diagnostic.reason = FailureReason::TIMEOUT;
		response.diagnostic.message =
		    "compilation exceeded the " + std::to_string(config_.timeout.count()) + " second limit";
		return response;
	}

	response.diagnostic.exit_code = result.exit_code;
	if (result.status != CompileStatus::SUCCESS) {
		response.diagnostic.reason = FailureReason::NONZERO_EXIT;
		response.diagnostic.message = "compiler exited with status " + std::to_string(result.exit_code);
		return response;
	}

	std::string error;
	if (!read_regular_file(result.artifact_path, response.artifact.bytes, error)) {
		logger_.error("Engine reported success but " + result.artifact_path.string() + " is unusable: " + error);
		response.diagnostic.reason = FailureReason::MISSING_ARTIFACT;
		response.diagnostic.message =
		    "compiler exited successfully but produced no " + config_.artifact_filename() + " (" + error + ")";
		return response;
	}

	response.status = CompileStatus::SUCCESS;
	response.artifact.filename = config_.artifact_filename();
	response.artifact.media_type = ARTIFACT_MEDIA_TYPE;
	response.diagnostic = Diagnostic{};
	logger_.info("Artifact " + response.artifact.filename + " ready (" +
	             std::to_string(response.artifact.bytes.size()) + " bytes)");
	return response;
}

CompileResponse ResultAssembler::reject_archive(const InvalidArchiveException& ex) {
	logger_.warning("Rejected asset archive: " + ex.detail());

	CompileResponse response;
	response.diagnostic.reason = FailureReason::INVALID_ARCHIVE;
	response.diagnostic.message = ex.detail();
	return response;
}

}  // namespace texbox
