#include <gtest/gtest.h>

#include "compile_service.hpp"
#include "process_runner.hpp"
#include "test_support.hpp"
#include "zip_builder.hpp"

using namespace std::chrono_literals;
using texbox::CompileResponse;
using texbox::CompileService;
using texbox::CompileStatus;
using texbox::EngineConfig;
using texbox::FailureReason;
using texbox::load_engine_config;
using texbox::prepare_cache_dir;

// End-to-end runs against the configured TeX engine (LATEX_ENGINE, tectonic
// by default). Tests that need the engine are skipped when it is not
// installed. The same outcomes (success, missing asset, timeout with group
// kill) are covered without a TeX installation by the scripted engine in
// test_compile_service.cpp: CompilesSourceWithoutAssets,
// MissingAssetIsNonzeroExit and HungEngineTimesOut.
class LatexScenarioTest : public ::testing::Test {
   protected:
	void SetUp() override {
		config_ = load_engine_config();
		config_.work_root = dir_.path() / "work";
		config_.kill_grace = 500ms;
		if (!std::getenv("TECTONIC_CACHE_DIR")) {
			config_.cache_dir = fs::temp_directory_path() / "texbox-test-cache";
		}
		prepare_cache_dir(config_, logger_);
		service_ = std::make_unique<CompileService>(config_, logger_);
	}

	bool engine_available() const { return !texbox::resolve_executable(config_.engine).empty(); }

	// Counts live processes whose working directory lies under the work root.
	size_t processes_in_work_root() const {
		size_t count = 0;
		std::error_code ec;
		for (const auto& entry : fs::directory_iterator("/proc", ec)) {
			std::string name = entry.path().filename().string();
			if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
				continue;
			}
			std::error_code link_ec;
			fs::path cwd = fs::read_symlink(entry.path() / "cwd", link_ec);
			if (link_ec) {
				continue;
			}
			if (cwd.string().rfind(config_.work_root.string(), 0) == 0 &&
			    process_alive(static_cast<pid_t>(std::stol(name)))) {
				count++;
			}
		}
		return count;
	}

	TempDir dir_;
	EngineConfig config_;
	Logger logger_ = quiet_logger();
	std::unique_ptr<CompileService> service_;
};

TEST_F(LatexScenarioTest, MinimalDocumentProducesPdf) {
	if (!engine_available()) {
		GTEST_SKIP() << config_.engine << " is not installed";
	}

	CompileResponse response =
	    service_->compile(to_bytes("\\documentclass{article}\\begin{document}Hi\\end{document}"), nullptr);

	ASSERT_EQ(response.status, CompileStatus::SUCCESS) << response.diagnostic.message << "\n"
	                                                   << response.diagnostic.stdout_text
	                                                   << response.diagnostic.stderr_text;
	ASSERT_GE(response.artifact.bytes.size(), 4u);
	EXPECT_EQ(from_bytes(std::vector<uint8_t>(response.artifact.bytes.begin(), response.artifact.bytes.begin() + 4)),
	          "%PDF");
	EXPECT_EQ(service_->workspaces().live_workspaces(), 0u);
}

TEST_F(LatexScenarioTest, MissingFigureIsNonzeroExit) {
	if (!engine_available()) {
		GTEST_SKIP() << config_.engine << " is not installed";
	}

	CompileResponse response = service_->compile(to_bytes("\\documentclass{article}\\usepackage{graphicx}"
	                                                      "\\begin{document}\\includegraphics{fig.png}\\end{document}"),
	                                             nullptr);

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::NONZERO_EXIT);
	EXPECT_NE(response.diagnostic.exit_code, 0);
	std::string output = response.diagnostic.stdout_text + response.diagnostic.stderr_text;
	EXPECT_NE(output.find("fig.png"), std::string::npos) << output;
}

TEST_F(LatexScenarioTest, TraversalArchiveIsRejectedBeforeInvocation) {
	// Points at a file that does not exist: the request must fail on the
	// archive without trying to start anything.
	config_.engine = (dir_.path() / "engine-must-not-run").string();
	auto archive = ZipBuilder().add_file("../../etc/passwd", "root::0:0:root:/root:/bin/sh\n").build();

	CompileResponse response =
	    service_->compile(to_bytes("\\documentclass{article}\\begin{document}Hi\\end{document}"), &archive);

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::INVALID_ARCHIVE);
	EXPECT_FALSE(fs::exists(dir_.path() / "etc"));
	EXPECT_EQ(service_->workspaces().live_workspaces(), 0u);
}

TEST_F(LatexScenarioTest, InfiniteLoopTimesOut) {
	if (!engine_available()) {
		GTEST_SKIP() << config_.engine << " is not installed";
	}
	config_.timeout = 1s;

	auto started = std::chrono::steady_clock::now();
	CompileResponse response = service_->compile(
	    to_bytes("\\documentclass{article}\\begin{document}\\def\\x{\\x}\\x\\end{document}"), nullptr);
	auto elapsed = std::chrono::steady_clock::now() - started;

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::TIMEOUT);
	EXPECT_LT(elapsed, 1s + config_.kill_grace + 1s);
	EXPECT_EQ(processes_in_work_root(), 0u);
	EXPECT_EQ(service_->workspaces().live_workspaces(), 0u);
}
