#pragma once

#include <sys/stat.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Builds small ZIP archives in memory for the extractor tests. Members are
// written with Unix attributes so that links and special files can be
// expressed.
class ZipBuilder {
   public:
	ZipBuilder& add_file(const std::string& name, const std::string& content, bool deflate = true) {
		Member m;
		m.name = name;
		m.content = content;
		m.deflate = deflate;
		m.mode = S_IFREG | 0644;
		members_.push_back(m);
		return *this;
	}

	ZipBuilder& add_directory(const std::string& name) {
		Member m;
		m.name = name;
		m.deflate = false;
		m.mode = S_IFDIR | 0755;
		members_.push_back(m);
		return *this;
	}

	ZipBuilder& add_symlink(const std::string& name, const std::string& target) {
		Member m;
		m.name = name;
		m.content = target;
		m.deflate = false;
		m.mode = S_IFLNK | 0777;
		members_.push_back(m);
		return *this;
	}

	ZipBuilder& add_fifo(const std::string& name) {
		Member m;
		m.name = name;
		m.deflate = false;
		m.mode = S_IFIFO | 0644;
		members_.push_back(m);
		return *this;
	}

	ZipBuilder& add_encrypted(const std::string& name, const std::string& content) {
		add_file(name, content, false);
		members_.back().flags |= 0x0001;
		return *this;
	}

	// Stores a checksum that does not match the content.
	ZipBuilder& add_corrupt_crc(const std::string& name, const std::string& content) {
		add_file(name, content, false);
		members_.back().bad_crc = true;
		return *this;
	}

	std::vector<uint8_t> build() const {
		std::vector<uint8_t> out;
		std::vector<uint8_t> central;

		for (const auto& m : members_) {
			std::vector<uint8_t> data = m.deflate ? raw_deflate(m.content) : bytes(m.content);
			uint32_t crc = static_cast<uint32_t>(
			    crc32(0L, reinterpret_cast<const Bytef*>(m.content.data()), static_cast<uInt>(m.content.size())));
			if (m.bad_crc) {
				crc ^= 0xDEADBEEF;
			}
			uint16_t method = m.deflate ? 8 : 0;
			uint32_t offset = static_cast<uint32_t>(out.size());

			put32(out, 0x04034b50);
			put16(out, 20);
			put16(out, m.flags);
			put16(out, method);
			put16(out, 0);
			put16(out, 0x21);
			put32(out, crc);
			put32(out, static_cast<uint32_t>(data.size()));
			put32(out, static_cast<uint32_t>(m.content.size()));
			put16(out, static_cast<uint16_t>(m.name.size()));
			put16(out, 0);
			out.insert(out.end(), m.name.begin(), m.name.end());
			out.insert(out.end(), data.begin(), data.end());

			put32(central, 0x02014b50);
			put16(central, (3 << 8) | 20);
			put16(central, 20);
			put16(central, m.flags);
			put16(central, method);
			put16(central, 0);
			put16(central, 0x21);
			put32(central, crc);
			put32(central, static_cast<uint32_t>(data.size()));
			put32(central, static_cast<uint32_t>(m.content.size()));
			put16(central, static_cast<uint16_t>(m.name.size()));
			put16(central, 0);
			put16(central, 0);
			put16(central, 0);
			put16(central, 0);
			put32(central, static_cast<uint32_t>(m.mode) << 16);
			put32(central, offset);
			central.insert(central.end(), m.name.begin(), m.name.end());
		}

		uint32_t cd_offset = static_cast<uint32_t>(out.size());
		out.insert(out.end(), central.begin(), central.end());

		put32(out, 0x06054b50);
		put16(out, 0);
		put16(out, 0);
		put16(out, static_cast<uint16_t>(members_.size()));
		put16(out, static_cast<uint16_t>(members_.size()));
		put32(out, static_cast<uint32_t>(central.size()));
		put32(out, cd_offset);
		put16(out, 0);
		return out;
	}

   private:
	struct Member {
		std::string name;
		std::string content;
		bool deflate = false;
		uint32_t mode = 0;
		uint16_t flags = 0;
		bool bad_crc = false;
	};

	static void put16(std::vector<uint8_t>& out, uint16_t v) {
		out.push_back(static_cast<uint8_t>(v & 0xff));
		out.push_back(static_cast<uint8_t>(v >> 8));
	}

	static void put32(std::vector<uint8_t>& out, uint32_t v) {
		put16(out, static_cast<uint16_t>(v & 0xffff));
		put16(out, static_cast<uint16_t>(v >> 16));
	}

	static std::vector<uint8_t> bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

	static std::vector<uint8_t> raw_deflate(const std::string& s) {
		z_stream zs{};
		if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
			throw std::runtime_error("deflateInit2 failed");
		}
		std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(s.size())) + 16);
		zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(s.data()));
		zs.avail_in = static_cast<uInt>(s.size());
		zs.next_out = out.data();
		zs.avail_out = static_cast<uInt>(out.size());
		int rc = deflate(&zs, Z_FINISH);
		deflateEnd(&zs);
		if (rc != Z_STREAM_END) {
			throw std::runtime_error("deflate failed");
		}
		out.resize(zs.total_out);
		return out;
	}

	std::vector<Member> members_;
};
