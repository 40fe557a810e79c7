#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning wrapper for a read-only POSIX file descriptor; closes on every exit path.
 * Usage: UniqueFd fd = UniqueFd::open_read_only(path, msg); if (!fd.valid()) { report msg }
 */
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }

  static UniqueFd open_read_only(const std::string& path, std::string& msg) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) msg = "can not open file: " + path + " (" + std::strerror(errno) + ")";
    return UniqueFd(fd);
  }

  // fstat on the open descriptor; st is left untouched on failure.
  bool stat(struct stat& st, std::string& msg) const {
    if (::fstat(fd_, &st) != 0) { msg = std::string("can not read file stat: ") + std::strerror(errno); return false; }
    return true;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
private:
  int fd_;
};
