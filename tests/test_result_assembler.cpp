#include <gtest/gtest.h>

#include "result_assembler.hpp"
#include "test_support.hpp"

using texbox::CompilationResult;
using texbox::CompileResponse;
using texbox::CompileStatus;
using texbox::EngineConfig;
using texbox::FailureReason;
using texbox::ResultAssembler;

class ResultAssemblerTest : public ::testing::Test {
   protected:
	CompilationResult engine_result(int exit_code) {
		CompilationResult result;
		result.exit_code = exit_code;
		result.status = exit_code == 0 ? CompileStatus::SUCCESS : CompileStatus::FAILURE;
		if (exit_code == 0) {
			result.artifact_path = dir_.path() / "main.pdf";
		}
		result.stdout_text = "engine stdout";
		result.stderr_text = "engine stderr";
		return result;
	}

	TempDir dir_;
	EngineConfig config_;
	Logger logger_ = quiet_logger();
	ResultAssembler assembler_{config_, logger_};
};

TEST(FailureReasonTest, WireNames) {
	EXPECT_STREQ(texbox::failure_reason_name(FailureReason::NONZERO_EXIT), "nonzero_exit");
	EXPECT_STREQ(texbox::failure_reason_name(FailureReason::TIMEOUT), "timeout");
	EXPECT_STREQ(texbox::failure_reason_name(FailureReason::MISSING_ARTIFACT), "missing_artifact");
	EXPECT_STREQ(texbox::failure_reason_name(FailureReason::INVALID_ARCHIVE), "invalid_archive");
}

TEST_F(ResultAssemblerTest, SuccessReturnsArtifactUnmodified) {
	std::string pdf("%PDF-1.5\n\x00\x01\x02\xff binary\n%%EOF\n", 27);
	write_text(dir_.path() / "main.pdf", pdf);

	CompileResponse response = assembler_.assemble(engine_result(0));

	ASSERT_EQ(response.status, CompileStatus::SUCCESS);
	EXPECT_EQ(response.artifact.bytes, to_bytes(pdf));
	EXPECT_EQ(response.artifact.filename, "main.pdf");
	EXPECT_EQ(response.artifact.media_type, "application/pdf");
}

TEST_F(ResultAssemblerTest, ArtifactNameFollowsMainFile) {
	config_.main_filename = "thesis.tex";
	write_text(dir_.path() / "thesis.pdf", "%PDF");
	CompilationResult result = engine_result(0);
	result.artifact_path = dir_.path() / "thesis.pdf";

	CompileResponse response = assembler_.assemble(result);

	ASSERT_EQ(response.status, CompileStatus::SUCCESS);
	EXPECT_EQ(response.artifact.filename, "thesis.pdf");
}

TEST_F(ResultAssemblerTest, ZeroExitWithoutArtifactIsMissingArtifact) {
	CompileResponse response = assembler_.assemble(engine_result(0));

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::MISSING_ARTIFACT);
	EXPECT_EQ(response.diagnostic.exit_code, 0);
	EXPECT_EQ(response.diagnostic.stdout_text, "engine stdout");
	EXPECT_EQ(response.diagnostic.stderr_text, "engine stderr");
	EXPECT_TRUE(response.artifact.bytes.empty());
}

TEST_F(ResultAssemblerTest, SymlinkedArtifactIsMissingArtifact) {
	fs::path secret = dir_.path() / "secret";
	write_text(secret, "not for you");
	fs::create_symlink(secret, dir_.path() / "main.pdf");

	CompileResponse response = assembler_.assemble(engine_result(0));

	EXPECT_EQ(response.diagnostic.reason, FailureReason::MISSING_ARTIFACT);
	EXPECT_TRUE(response.artifact.bytes.empty());
}

TEST_F(ResultAssemblerTest, DirectoryArtifactIsMissingArtifact) {
	fs::create_directory(dir_.path() / "main.pdf");

	CompileResponse response = assembler_.assemble(engine_result(0));

	EXPECT_EQ(response.diagnostic.reason, FailureReason::MISSING_ARTIFACT);
}

TEST_F(ResultAssemblerTest, NonzeroExitKeepsCodeAndStreams) {
	write_text(dir_.path() / "main.pdf", "%PDF stale");

	CompileResponse response = assembler_.assemble(engine_result(1));

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::NONZERO_EXIT);
	EXPECT_EQ(response.diagnostic.exit_code, 1);
	EXPECT_EQ(response.diagnostic.stdout_text, "engine stdout");
	EXPECT_EQ(response.diagnostic.stderr_text, "engine stderr");
	EXPECT_TRUE(response.artifact.bytes.empty());
}

TEST_F(ResultAssemblerTest, TimeoutTakesPrecedence) {
	CompilationResult result = engine_result(137);
	result.timed_out = true;

	CompileResponse response = assembler_.assemble(result);

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::TIMEOUT);
	EXPECT_EQ(response.diagnostic.exit_code, -1);
	EXPECT_NE(response.diagnostic.message.find("60 second"), std::string::npos);
	EXPECT_EQ(response.diagnostic.stdout_text, "engine stdout");
}

TEST_F(ResultAssemblerTest, RejectedArchiveCarriesDetail) {
	InvalidArchiveException ex("../x", "entry '../x' escapes the destination directory");

	CompileResponse response = assembler_.reject_archive(ex);

	EXPECT_EQ(response.status, CompileStatus::FAILURE);
	EXPECT_EQ(response.diagnostic.reason, FailureReason::INVALID_ARCHIVE);
	EXPECT_EQ(response.diagnostic.exit_code, -1);
	EXPECT_EQ(response.diagnostic.message, "entry '../x' escapes the destination directory");
	EXPECT_TRUE(response.diagnostic.stdout_text.empty());
}
