#pragma once

#include <cstdint>
#include <vector>

#include "archive_extractor.hpp"
#include "compiler_invoker.hpp"
#include "engine_config.hpp"
#include "logger.hpp"
#include "result_assembler.hpp"
#include "workspace.hpp"

namespace texbox {

// Handles one compile request from start to finish: workspace, assets,
// source, engine run, result. Safe to call from several threads at once;
// requests share nothing but the engine cache directory.
class CompileService {
   public:
	CompileService(const EngineConfig& config, Logger& logger);

	// archive may be null when no assets were uploaded. Request-level failures
	// (bad archive, engine error, timeout, missing artifact) come back as a
	// FAILURE response; only internal faults throw. Either way the workspace
	// is gone when this returns.
	CompileResponse compile(const std::vector<uint8_t>& source, const std::vector<uint8_t>* archive);

	WorkspaceManager& workspaces() { return workspaces_; }

   private:
	const EngineConfig& config_;
	Logger& logger_;
	WorkspaceManager workspaces_;
};

}  // namespace texbox
