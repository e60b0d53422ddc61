#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "compiler_invoker.hpp"
#include "custom_exceptions.hpp"
#include "engine_config.hpp"
#include "logger.hpp"

namespace texbox {

enum class FailureReason { NONZERO_EXIT, TIMEOUT, MISSING_ARTIFACT, INVALID_ARCHIVE };

// Wire names: "nonzero_exit", "timeout", "missing_artifact", "invalid_archive".
const char* failure_reason_name(FailureReason reason);

struct Diagnostic {
	FailureReason reason = FailureReason::NONZERO_EXIT;
	// -1 when the engine did not exit on its own or never ran.
	int exit_code = -1;
	std::string message;
	std::string stdout_text;
	std::string stderr_text;
};

struct Artifact {
	std::string filename;
	std::string media_type;
	std::vector<uint8_t> bytes;
};

struct CompileResponse {
	CompileStatus status = CompileStatus::FAILURE;
	Artifact artifact;
	Diagnostic diagnostic;
};

class ResultAssembler {
   public:
	ResultAssembler(const EngineConfig& config, Logger& logger);

	CompileResponse assemble(const CompilationResult& result);

	CompileResponse reject_archive(const InvalidArchiveException& ex);

   private:
	const EngineConfig& config_;
	Logger& logger_;
};

}  // namespace texbox
