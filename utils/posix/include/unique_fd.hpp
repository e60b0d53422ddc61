#pragma once

#include <unistd.h>

#include <utility>

// Owns a file descriptor and closes it on destruction.
class UniqueFd {
   public:
	UniqueFd() : fd_(-1) {}
	explicit UniqueFd(int fd) : fd_(fd) {}
	~UniqueFd() { reset(); }

	UniqueFd(const UniqueFd&) = delete;
	UniqueFd& operator=(const UniqueFd&) = delete;

	UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
	UniqueFd& operator=(UniqueFd&& other) noexcept {
		if (this != &other) {
			reset(std::exchange(other.fd_, -1));
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	void reset(int fd = -1) {
		if (fd_ >= 0) {
			::close(fd_);
		}
		fd_ = fd;
	}

   private:
	int fd_;
};
