#include <gtest/gtest.h>

#include "client.hpp"
#include "server_fixture.hpp"
#include "zip_builder.hpp"

using client::ClientApp;

class ClientAppTest : public ServerFixture {
   protected:
	fs::path input(const std::string& name, const std::string& text) {
		fs::path path = files_.path() / name;
		write_text(path, text);
		return path;
	}

	TempDir files_;
};

TEST_F(ClientAppTest, PingSucceeds) {
	ClientApp app("127.0.0.1", port(), logger_);
	EXPECT_EQ(app.ping(), client::EXIT_OK);
}

TEST_F(ClientAppTest, WritesArtifactToRequestedPath) {
	ClientApp app("127.0.0.1", port(), logger_);
	fs::path out = files_.path() / "out.pdf";

	EXPECT_EQ(app.compile(input("paper.tex", "hello").string(), "", out.string()), client::EXIT_OK);
	EXPECT_EQ(read_text(out), "%PDF-1.5\nhello");
}

TEST_F(ClientAppTest, UploadsAssetArchive) {
	auto archive = ZipBuilder().add_file("figures/a.txt", "a").build();
	fs::path zip = files_.path() / "assets.zip";
	write_text(zip, from_bytes(archive));
	fs::path out = files_.path() / "out.pdf";

	ClientApp app("127.0.0.1", port(), logger_);
	EXPECT_EQ(app.compile(input("paper.tex", "hello").string(), zip.string(), out.string()), client::EXIT_OK);
}

TEST_F(ClientAppTest, CompileFailureExitCode) {
	ClientApp app("127.0.0.1", port(), logger_);
	fs::path out = files_.path() / "out.pdf";

	EXPECT_EQ(app.compile(input("paper.tex", "FAIL").string(), "", out.string()), client::EXIT_COMPILE_FAILED);
	EXPECT_FALSE(fs::exists(out));
}

TEST_F(ClientAppTest, BadArchiveExitCode) {
	fs::path zip = input("assets.zip", "not a zip");
	ClientApp app("127.0.0.1", port(), logger_);

	EXPECT_EQ(app.compile(input("paper.tex", "hello").string(), zip.string(), (files_.path() / "o.pdf").string()),
	          client::EXIT_COMPILE_FAILED);
}

TEST_F(ClientAppTest, ZeroByteArchiveIsStillSent) {
	fs::path zip = input("assets.zip", "");
	ClientApp app("127.0.0.1", port(), logger_);
	fs::path out = files_.path() / "o.pdf";

	EXPECT_EQ(app.compile(input("paper.tex", "hello").string(), zip.string(), out.string()),
	          client::EXIT_COMPILE_FAILED);
	EXPECT_FALSE(fs::exists(out));
}

TEST_F(ClientAppTest, NonTexFileIsRejected) {
	ClientApp app("127.0.0.1", port(), logger_);
	EXPECT_EQ(app.compile(input("notes.txt", "hello").string(), "", (files_.path() / "o.pdf").string()),
	          client::EXIT_REJECTED);
}

TEST_F(ClientAppTest, MissingInputIsUsageError) {
	ClientApp app("127.0.0.1", port(), logger_);
	EXPECT_EQ(app.compile((files_.path() / "absent.tex").string(), "", ""), client::EXIT_USAGE);
}

TEST_F(ClientAppTest, UnreachableServerThrows) {
	uint16_t unused = port();
	server_->stop();

	ClientApp app("127.0.0.1", unused, logger_);
	EXPECT_THROW(app.ping(), ConnectionException);
}
