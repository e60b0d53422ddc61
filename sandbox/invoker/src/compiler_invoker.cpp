#include "compiler_invoker.hpp"

namespace fs = std::filesystem;

namespace texbox {

namespace {

std::string join_command(const std::vector<std::string>& argv) {
	std::string out;
	for (const auto& arg : argv) {
		if (!out.empty()) {
			out += ' ';
		}
		out += arg;
	}
	return out;
}

}  // namespace

CompilerInvoker::CompilerInvoker(const EngineConfig& config, Logger& logger) : config_(config), logger_(logger) {}

CompilationResult CompilerInvoker::invoke(const fs::path& work_dir) {
	ProcessSpec spec;
	spec.argv = config_.build_command(work_dir);
	spec.work_dir = work_dir;
	spec.env.emplace_back(config_.cache_env_var(), config_.cache_dir.string());
	spec.timeout = config_.timeout;
	spec.kill_grace = config_.kill_grace;
	spec.max_capture_bytes = config_.max_capture_bytes;

	logger_.info("Running engine: " + join_command(spec.argv));
	ProcessOutcome outcome = run_process(spec, logger_);

	CompilationResult result;
	result.timed_out = outcome.timed_out;
	result.exit_code = outcome.exit_code;
	result.stdout_text = std::move(outcome.stdout_text);
	result.stderr_text = std::move(outcome.stderr_text);
	result.output_truncated = outcome.stdout_truncated || outcome.stderr_truncated;
	result.elapsed = outcome.elapsed;

	if (outcome.timed_out) {
		result.status = CompileStatus::FAILURE;
		logger_.warning("Engine timed out after " + std::to_string(config_.timeout.count()) + " s");
	} else if (outcome.exit_code == 0) {
		result.status = CompileStatus::SUCCESS;
		result.artifact_path = work_dir / config_.artifact_filename();
		logger_.info("Engine succeeded in " + std::to_string(outcome.elapsed.count()) + " ms");
	} else {
		result.status = CompileStatus::FAILURE;
		logger_.info("Engine failed with exit code " + std::to_string(outcome.exit_code) + " after " +
		             std::to_string(outcome.elapsed.count()) + " ms");
	}
	if (result.output_truncated) {
		logger_.warning("Engine output exceeded " + std::to_string(config_.max_capture_bytes) +
		                " bytes and was truncated");
	}

	return result;
}

}  // namespace texbox
