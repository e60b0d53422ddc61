#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "custom_exceptions.hpp"
#include "logger.hpp"

namespace texbox {

struct ExtractionSummary {
	size_t files = 0;
	size_t directories = 0;
	uint64_t bytes = 0;
};

// Turns a stored ZIP member name into a clean relative path ("a/./b/../c" ->
// "a/c"). Backslashes count as separators. Throws InvalidArchiveException for
// empty, absolute, drive-qualified or NUL-carrying names and for names that
// climb above the destination. An empty result means the root itself.
std::string normalize_entry_path(const std::string& name);

// True when path is root or lies below it. Both are compared lexically.
bool path_is_within(const std::filesystem::path& root, const std::filesystem::path& path);

// Unpacks ZIP archives into a directory, reading them through libarchive.
//
// Every member is validated before the first byte is written: a single bad
// name or unsupported member type rejects the whole archive with an
// InvalidArchiveException that names the member. Symlinks, device nodes,
// FIFOs, sockets and hard links are rejected rather than materialized. The extractor does
// not undo partial writes; the owner of the destination discards it.
class ArchiveExtractor {
   public:
	explicit ArchiveExtractor(Logger& logger);

	ExtractionSummary extract(const std::vector<uint8_t>& archive, const std::filesystem::path& destination);

   private:
	Logger& logger_;
};

}  // namespace texbox
