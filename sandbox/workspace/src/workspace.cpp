#include "workspace.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include "unique_fd.hpp"

namespace fs = std::filesystem;

namespace texbox {

namespace {

constexpr auto WORKSPACE_PREFIX = "latexwork_";

void make_owner_writable(const fs::path& root) {
	std::error_code ec;
	fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);

	for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
	     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
		std::error_code entry_ec;
		if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
			fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, entry_ec);
		}
	}
}

}  // namespace

bool remove_tree(const fs::path& root, std::string& error) {
	std::error_code ec;
	fs::remove_all(root, ec);
	if (!ec) {
		return true;
	}

	make_owner_writable(root);
	ec.clear();
	fs::remove_all(root, ec);
	if (ec) {
		error = ec.message();
		return false;
	}
	return true;
}

Workspace::Workspace(fs::path root, std::string main_filename, WorkspaceManager& manager, Logger& logger)
    : root_(std::move(root)),
      main_filename_(std::move(main_filename)),
      created_at_(std::chrono::system_clock::now()),
      manager_(manager),
      logger_(logger) {}

Workspace::~Workspace() { manager_.release(*this); }

fs::path Workspace::write_source(const std::vector<uint8_t>& source) {
	fs::path target = root_ / main_filename_;

	struct stat st;
	if (::lstat(target.c_str(), &st) == 0) {
		logger_.warning("Archive provided '" + main_filename_ + "', replacing it with the primary source");
		std::error_code ec;
		fs::remove_all(target, ec);
		if (ec) {
			logger_.error("Cannot remove colliding " + target.string() + ": " + ec.message());
			throw WorkspaceException("cannot replace " + target.string() + ": " + ec.message());
		}
	}

	UniqueFd fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644));
	if (!fd.valid()) {
		int err = errno;
		logger_.error("open(" + target.string() + ") failed: " + std::strerror(err));
		throw WorkspaceException("cannot create " + target.string() + ": " + std::strerror(err));
	}

	const uint8_t* data = source.data();
	size_t left = source.size();
	while (left > 0) {
		ssize_t written = ::write(fd.get(), data, left);
		if (written < 0) {
			if (errno == EINTR) {
				continue;
			}
			int err = errno;
			logger_.error("write(" + target.string() + ") failed: " + std::strerror(err));
			throw WorkspaceException("cannot write " + target.string() + ": " + std::strerror(err));
		}
		data += written;
		left -= static_cast<size_t>(written);
	}

	logger_.debug("Wrote source " + target.string() + " (" + std::to_string(source.size()) + " bytes)");
	return target;
}

WorkspaceManager::WorkspaceManager(fs::path work_root, std::string main_filename, Logger& logger)
    : work_root_(std::move(work_root)), main_filename_(std::move(main_filename)), logger_(logger), live_(0) {}

std::unique_ptr<Workspace> WorkspaceManager::acquire() {
	std::error_code ec;
	fs::create_directories(work_root_, ec);
	if (ec) {
		logger_.error("Cannot create work root " + work_root_.string() + ": " + ec.message());
		throw WorkspaceException("cannot create work root " + work_root_.string());
	}

	// mkdtemp creates the directory with mode 0700 and a random suffix.
	std::string pattern = (work_root_ / WORKSPACE_PREFIX).string() + "XXXXXX";
	std::vector<char> buf(pattern.begin(), pattern.end());
	buf.push_back('\0');
	if (!::mkdtemp(buf.data())) {
		logger_.error("mkdtemp(" + pattern + ") failed: " + std::strerror(errno));
		throw WorkspaceException("cannot create workspace under " + work_root_.string());
	}

	fs::path root(buf.data());
	live_++;
	logger_.debug("Workspace acquired: " + root.string());

	return std::unique_ptr<Workspace>(new Workspace(root, main_filename_, *this, logger_));
}

void WorkspaceManager::release(const Workspace& workspace) {
	auto lived = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() -
	                                                                   workspace.created_at());
	std::string error;
	if (!remove_tree(workspace.root(), error)) {
		logger_.error("Failed to remove workspace " + workspace.root().string() + ": " + error);
	} else {
		logger_.debug("Workspace released: " + workspace.root().string() + " after " +
		              std::to_string(lived.count()) + " ms");
	}
	live_--;
}

}  // namespace texbox
