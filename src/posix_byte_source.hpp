#pragma once
/*
 * PosixByteSource
 *
 * Purpose: IByteSource over a regular file, using pread on a UniqueFd.
 * Usage: auto src = PosixByteSource::open(path, msg); nullptr + msg if the path is
 *        missing or not a regular file. The descriptor closes with the object.
 */
#include "byte_source.hpp"
#include "posix_fd.hpp"

class PosixByteSource : public IByteSource {
public:
  static std::unique_ptr<IByteSource> open(const std::filesystem::path& path, std::string& msg);

  std::uint64_t size() const override { return size_; }
  bool read_at(std::uint64_t offset, char* dst, size_t len, size_t& got, std::string& msg) override;

private:
  PosixByteSource(UniqueFd fd, std::uint64_t size, std::string path)
    : fd_(std::move(fd)), size_(size), path_(std::move(path)) {}

  UniqueFd fd_;
  std::uint64_t size_;
  std::string path_;
};
