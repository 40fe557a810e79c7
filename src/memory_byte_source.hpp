#pragma once
/*
 * MemoryByteSource
 *
 * Purpose: IByteSource over an in-memory string; drives the scanners without a file.
 * Feature: fault injection (fail the Nth read) to exercise the unavailable path.
 */
#include "byte_source.hpp"
#include <algorithm>
#include <cstring>

class MemoryByteSource : public IByteSource {
public:
  explicit MemoryByteSource(std::string data, int fail_on_read = -1)
    : data_(std::move(data)), fail_on_read_(fail_on_read) {}

  std::uint64_t size() const override { return data_.size(); }

  bool read_at(std::uint64_t offset, char* dst, size_t len, size_t& got, std::string& msg) override {
    got = 0;
    int n = reads_++;
    if (fail_on_read_ >= 0 && n == fail_on_read_) { msg = "injected read failure"; return false; }
    if (offset >= data_.size()) return true;
    got = std::min<size_t>(len, data_.size() - static_cast<size_t>(offset));
    std::memcpy(dst, data_.data() + offset, got);
    return true;
  }

  int reads() const { return reads_; }

private:
  std::string data_;
  int fail_on_read_;
  int reads_ = 0;
};
