#include "archive_extractor.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <memory>
#include <system_error>

#include "unique_fd.hpp"

namespace fs = std::filesystem;

namespace texbox {

namespace {

constexpr size_t IO_CHUNK = 64 * 1024;

enum class EntryKind { FILE, DIRECTORY };

struct ZipEntry {
	std::string name;
	std::string relative;
	EntryKind kind;
	int64_t size;
};

struct ArchiveCloser {
	void operator()(struct archive* a) const { archive_read_free(a); }
};
using ArchivePtr = std::unique_ptr<struct archive, ArchiveCloser>;

std::string archive_message(struct archive* a) {
	const char* msg = archive_error_string(a);
	return msg ? msg : "unknown archive error";
}

ArchivePtr open_zip(const std::vector<uint8_t>& data) {
	if (data.empty()) {
		throw InvalidArchiveException("", "archive is empty, not a ZIP archive");
	}

	ArchivePtr a(archive_read_new());
	if (!a) {
		throw WorkspaceException("archive_read_new failed");
	}
	archive_read_support_format_zip(a.get());
	if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
		throw InvalidArchiveException("", "not a readable ZIP archive: " + archive_message(a.get()));
	}
	return a;
}

// Advances to the next member. Returns false at the end of the archive.
bool next_header(struct archive* a, struct archive_entry*& entry) {
	int ret = archive_read_next_header(a, &entry);
	if (ret == ARCHIVE_EOF) {
		return false;
	}
	// ARCHIVE_WARN still yields a usable header; every field is checked below.
	if (ret != ARCHIVE_OK && ret != ARCHIVE_WARN) {
		const char* path = entry ? archive_entry_pathname(entry) : nullptr;
		std::string name = path ? path : "";
		throw InvalidArchiveException(name, "corrupt archive member" + (name.empty() ? "" : " '" + name + "'") +
		                                        ": " + archive_message(a));
	}
	return true;
}

ZipEntry classify_entry(struct archive_entry* entry) {
	const char* path = archive_entry_pathname(entry);
	ZipEntry out;
	out.name = path ? path : "";

	if (archive_entry_hardlink(entry)) {
		throw InvalidArchiveException(out.name, "hard link entry '" + out.name + "' is not allowed");
	}
	switch (archive_entry_filetype(entry)) {
		case AE_IFREG:
			out.kind = EntryKind::FILE;
			break;
		case AE_IFDIR:
			out.kind = EntryKind::DIRECTORY;
			break;
		case AE_IFLNK:
			throw InvalidArchiveException(out.name, "symbolic link entry '" + out.name + "' is not allowed");
		default:
			throw InvalidArchiveException(out.name, "special file entry '" + out.name + "' is not allowed");
	}

	out.relative = normalize_entry_path(out.name);
	out.size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : -1;

	if (out.kind == EntryKind::FILE) {
		if (out.relative.empty()) {
			throw InvalidArchiveException(out.name, "entry '" + out.name + "' resolves to the destination root");
		}
		if (archive_entry_is_encrypted(entry)) {
			throw InvalidArchiveException(out.name, "encrypted entry '" + out.name + "' is not supported");
		}
	}
	return out;
}

void write_all(int fd, const uint8_t* data, size_t len, const ZipEntry& entry) {
	while (len > 0) {
		ssize_t written = ::write(fd, data, len);
		if (written < 0) {
			if (errno == EINTR) {
				continue;
			}
			int err = errno;
			throw WorkspaceException("write of '" + entry.relative + "' failed: " + std::strerror(err));
		}
		data += written;
		len -= static_cast<size_t>(written);
	}
}

// Streams the current member into fd. libarchive verifies the CRC and
// reports a mismatch as a failed read at the end of the member.
uint64_t copy_data(struct archive* a, int fd, const ZipEntry& entry) {
	std::vector<uint8_t> buf(IO_CHUNK);
	uint64_t produced = 0;
	for (;;) {
		la_ssize_t n = archive_read_data(a, buf.data(), buf.size());
		if (n == 0) {
			break;
		}
		if (n < 0) {
			std::string msg = archive_message(a);
			if (msg.find("CRC") != std::string::npos || msg.find("crc") != std::string::npos) {
				throw InvalidArchiveException(entry.name, "CRC mismatch in '" + entry.name + "': " + msg);
			}
			throw InvalidArchiveException(entry.name, "cannot read '" + entry.name + "': " + msg);
		}
		produced += static_cast<uint64_t>(n);
		if (entry.size >= 0 && produced > static_cast<uint64_t>(entry.size)) {
			throw InvalidArchiveException(entry.name, "'" + entry.name + "' expands beyond its declared size");
		}
		write_all(fd, buf.data(), static_cast<size_t>(n), entry);
	}
	if (entry.size >= 0 && produced != static_cast<uint64_t>(entry.size)) {
		throw InvalidArchiveException(entry.name, "'" + entry.name + "' is shorter than its declared size");
	}
	return produced;
}

}  // namespace

std::string normalize_entry_path(const std::string& name) {
	if (name.empty()) {
		throw InvalidArchiveException(name, "entry with an empty name");
	}
	if (name.find('\0') != std::string::npos) {
		throw InvalidArchiveException(name, "entry name contains a NUL byte");
	}

	std::string path(name);
	std::replace(path.begin(), path.end(), '\\', '/');

	if (path.front() == '/') {
		throw InvalidArchiveException(name, "absolute entry path '" + name + "'");
	}
	if (path.size() >= 2 && path[1] == ':' && std::isalpha(static_cast<unsigned char>(path[0]))) {
		throw InvalidArchiveException(name, "drive-qualified entry path '" + name + "'");
	}

	std::vector<std::string> parts;
	size_t start = 0;
	while (start <= path.size()) {
		size_t end = path.find('/', start);
		if (end == std::string::npos) {
			end = path.size();
		}
		std::string part = path.substr(start, end - start);
		start = end + 1;

		if (part.empty() || part == ".") {
			continue;
		}
		if (part == "..") {
			if (parts.empty()) {
				throw InvalidArchiveException(name, "entry '" + name + "' escapes the destination directory");
			}
			parts.pop_back();
			continue;
		}
		parts.push_back(std::move(part));
	}

	std::string joined;
	for (const auto& part : parts) {
		if (!joined.empty()) {
			joined += '/';
		}
		joined += part;
	}
	return joined;
}

bool path_is_within(const fs::path& root, const fs::path& path) {
	fs::path base = root.lexically_normal();
	fs::path candidate = path.lexically_normal();

	auto base_it = base.begin();
	auto candidate_it = candidate.begin();
	for (; base_it != base.end(); ++base_it, ++candidate_it) {
		if (base_it->empty() && std::next(base_it) == base.end()) {
			// Trailing separator on the root.
			break;
		}
		if (candidate_it == candidate.end() || *base_it != *candidate_it) {
			return false;
		}
	}
	return true;
}

ArchiveExtractor::ArchiveExtractor(Logger& logger) : logger_(logger) {}

ExtractionSummary ArchiveExtractor::extract(const std::vector<uint8_t>& archive, const fs::path& destination) {
	std::error_code ec;
	fs::path root = fs::canonical(destination, ec);
	if (ec) {
		throw WorkspaceException("extraction root " + destination.string() + " is unusable: " + ec.message());
	}

	// First pass: headers only, nothing touches the disk.
	size_t entry_count = 0;
	{
		ArchivePtr a = open_zip(archive);
		struct archive_entry* header = nullptr;
		while (next_header(a.get(), header)) {
			ZipEntry entry = classify_entry(header);
			if (!path_is_within(root, root / entry.relative)) {
				throw InvalidArchiveException(entry.name,
				                              "entry '" + entry.name + "' escapes the destination directory");
			}
			entry_count++;
		}
	}
	logger_.debug("Archive validated: " + std::to_string(entry_count) + " entries");

	ExtractionSummary summary;
	ArchivePtr a = open_zip(archive);
	struct archive_entry* header = nullptr;
	while (next_header(a.get(), header)) {
		ZipEntry entry = classify_entry(header);
		fs::path target = root / entry.relative;

		if (entry.kind == EntryKind::DIRECTORY) {
			if (entry.relative.empty()) {
				continue;
			}
			fs::create_directories(target, ec);
			if (ec) {
				throw InvalidArchiveException(entry.name, "cannot create directory '" + entry.name + "': " + ec.message());
			}
			summary.directories++;
			continue;
		}

		fs::create_directories(target.parent_path(), ec);
		if (ec) {
			throw InvalidArchiveException(entry.name,
			                              "cannot create parent of '" + entry.name + "': " + ec.message());
		}
		fs::path real_parent = fs::canonical(target.parent_path(), ec);
		if (ec || !path_is_within(root, real_parent)) {
			throw InvalidArchiveException(entry.name, "entry '" + entry.name + "' resolves outside the destination");
		}

		UniqueFd fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644));
		if (!fd.valid()) {
			int err = errno;
			if (err == ELOOP || err == EISDIR) {
				throw InvalidArchiveException(entry.name,
				                              "entry '" + entry.name + "' collides with an existing non-file path");
			}
			logger_.error("open(" + target.string() + ") failed: " + std::strerror(err));
			throw WorkspaceException("cannot create '" + entry.relative + "': " + std::strerror(err));
		}

		uint64_t written = copy_data(a.get(), fd.get(), entry);

		logger_.debug("Extracted " + entry.relative + " (" + std::to_string(written) + " bytes)");
		summary.files++;
		summary.bytes += written;
	}

	logger_.info("Archive extracted: " + std::to_string(summary.files) + " files, " +
	             std::to_string(summary.directories) + " directories, " + std::to_string(summary.bytes) + " bytes");
	return summary;
}

}  // namespace texbox
