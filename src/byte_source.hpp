#pragma once
/*
 * IByteSource
 *
 * Purpose: read-only, byte-addressable view of one file for the duration of a
 *          single reader operation (length + positional reads).
 * Goal: decouple scanning from the file system (posix file / in-memory), enable testing.
 */
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

class IByteSource {
public:
  virtual ~IByteSource() = default;
  // Length in bytes, captured when the source was opened.
  virtual std::uint64_t size() const = 0;
  // Reads up to len bytes at offset into dst; got == 0 means end of data.
  // Returns false with msg on I/O failure.
  virtual bool read_at(std::uint64_t offset, char* dst, size_t len, size_t& got, std::string& msg) = 0;
};

// Opens a source for path, or returns nullptr with msg (missing, not a regular file, ...).
using ByteSourceFactory =
    std::function<std::unique_ptr<IByteSource>(const std::filesystem::path& path, std::string& msg)>;
