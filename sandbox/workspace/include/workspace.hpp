#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "custom_exceptions.hpp"
#include "logger.hpp"

namespace texbox {

class WorkspaceManager;

// A private directory owned by exactly one request. The directory and
// everything below it are removed when the object is destroyed.
class Workspace {
   public:
	~Workspace();

	Workspace(const Workspace&) = delete;
	Workspace& operator=(const Workspace&) = delete;

	const std::filesystem::path& root() const { return root_; }
	std::chrono::system_clock::time_point created_at() const { return created_at_; }

	// Writes the primary document under the fixed main file name. Called after
	// extraction; a file or directory of the same name left by the archive is
	// replaced.
	std::filesystem::path write_source(const std::vector<uint8_t>& source);

   private:
	friend class WorkspaceManager;

	Workspace(std::filesystem::path root, std::string main_filename, WorkspaceManager& manager, Logger& logger);

	std::filesystem::path root_;
	std::string main_filename_;
	std::chrono::system_clock::time_point created_at_;
	WorkspaceManager& manager_;
	Logger& logger_;
};

class WorkspaceManager {
   public:
	WorkspaceManager(std::filesystem::path work_root, std::string main_filename, Logger& logger);

	WorkspaceManager(const WorkspaceManager&) = delete;
	WorkspaceManager& operator=(const WorkspaceManager&) = delete;

	std::unique_ptr<Workspace> acquire();

	size_t live_workspaces() const { return live_.load(); }
	const std::filesystem::path& work_root() const { return work_root_; }

   private:
	friend class Workspace;

	void release(const Workspace& workspace);

	std::filesystem::path work_root_;
	std::string main_filename_;
	Logger& logger_;
	std::atomic<size_t> live_;
};

// Recursive removal that first restores owner rwx on directories, since an
// engine may leave read-only trees behind. Returns false if anything remains.
bool remove_tree(const std::filesystem::path& root, std::string& error);

}  // namespace texbox
