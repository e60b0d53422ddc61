#include "compile_service.hpp"

namespace texbox {

CompileService::CompileService(const EngineConfig& config, Logger& logger)
    : config_(config), logger_(logger), workspaces_(config.work_root, config.main_filename, logger) {}

CompileResponse CompileService::compile(const std::vector<uint8_t>& source, const std::vector<uint8_t>* archive) {
	std::unique_ptr<Workspace> workspace = workspaces_.acquire();
	logger_.info("Compile request in " + workspace->root().string() + ": source " + std::to_string(source.size()) +
	             " bytes, archive " + (archive ? std::to_string(archive->size()) + " bytes" : std::string("none")));

	ResultAssembler assembler(config_, logger_);

	if (archive) {
		ArchiveExtractor extractor(logger_);
		try {
			extractor.extract(*archive, workspace->root());
		} catch (const InvalidArchiveException& ex) {
			return assembler.reject_archive(ex);
		}
	}

	workspace->write_source(source);

	CompilerInvoker invoker(config_, logger_);
	CompilationResult result = invoker.invoke(workspace->root());

	CompileResponse response = assembler.assemble(result);
	if (response.status != CompileStatus::SUCCESS) {
		logger_.info(std::string("Compile request failed: ") + failure_reason_name(response.diagnostic.reason));
	}
	return response;
}

}  // namespace texbox
