#include "posix_byte_source.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

std::unique_ptr<IByteSource> PosixByteSource::open(const std::filesystem::path& path, std::string& msg) {
  const std::string p = path.string();
  struct stat st{};
  if (::stat(p.c_str(), &st) != 0) {
    msg = "can not stat file: " + p + " (" + std::strerror(errno) + ")";
    return nullptr;
  }
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + p; return nullptr; }

  UniqueFd fd = UniqueFd::open_read_only(p, msg);
  if (!fd.valid()) return nullptr;
  // the path may have been replaced between stat and open
  if (!fd.stat(st, msg)) return nullptr;
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + p; return nullptr; }
  if (st.st_size < 0) { msg = "negative file size: " + p; return nullptr; }

  return std::unique_ptr<IByteSource>(
      new PosixByteSource(std::move(fd), static_cast<std::uint64_t>(st.st_size), p));
}

bool PosixByteSource::read_at(std::uint64_t offset, char* dst, size_t len, size_t& got, std::string& msg) {
  got = 0;
  while (got < len) {
    ssize_t r = ::pread(fd_.get(), dst + got, len - got, static_cast<off_t>(offset + got));
    if (r < 0) {
      if (errno == EINTR) continue;
      msg = "read file failed: " + path_ + " (" + std::strerror(errno) + ")";
      return false;
    }
    if (r == 0) break;
    got += static_cast<size_t>(r);
  }
  return true;
}
