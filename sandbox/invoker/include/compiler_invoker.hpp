#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "engine_config.hpp"
#include "logger.hpp"
#include "process_runner.hpp"

namespace texbox {

enum class CompileStatus { SUCCESS, FAILURE };

// Outcome of one engine run. SUCCESS only means the engine exited with 0;
// artifact_path is where the artifact should be, not a promise that it is.
struct CompilationResult {
	CompileStatus status = CompileStatus::FAILURE;
	std::filesystem::path artifact_path;

	bool timed_out = false;
	int exit_code = -1;
	std::string stdout_text;
	std::string stderr_text;
	bool output_truncated = false;
	std::chrono::milliseconds elapsed{0};
};

class CompilerInvoker {
   public:
	CompilerInvoker(const EngineConfig& config, Logger& logger);

	// Runs the engine inside work_dir. Throws ProcessException when the engine
	// cannot be started.
	CompilationResult invoke(const std::filesystem::path& work_dir);

   private:
	const EngineConfig& config_;
	Logger& logger_;
};

}  // namespace texbox
