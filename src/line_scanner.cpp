#include "line_scanner.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <string_view>
#include "chunk_scan.hpp"

bool LineScanner::read_exact(std::uint64_t offset, size_t len, std::string& msg) {
  buf_.resize(len);
  size_t got = 0;
  if (!src_.read_at(offset, buf_.data(), len, got, msg)) return false;
  if (got < len) {
    msg = "file changed while reading: expected " + std::to_string(len) + " bytes at " +
          std::to_string(offset) + ", got " + std::to_string(got);
    return false;
  }
  return true;
}

bool LineScanner::resolve_line_start(std::uint64_t offset, std::uint64_t& line_start, std::string& msg) {
  spdlog::trace("Seeking line start before or at {}", offset);
  const std::uint64_t size = src_.size();
  if (offset == 0) { line_start = 0; return true; }
  if (offset >= size) {
    spdlog::trace("Line start found at EOF, file length = {}", size);
    line_start = size;
    return true;
  }
  std::uint64_t pos = offset;
  while (pos > 0) {
    std::uint64_t start = pos > chunk_size_ ? pos - chunk_size_ : 0;
    if (!read_exact(start, static_cast<size_t>(pos - start), msg)) return false;
    std::string_view chunk(buf_.data(), buf_.size());
    size_t i = chunk.rfind(kLineDelimiter);
    if (i != std::string_view::npos) {
      line_start = start + i + 1;
      spdlog::trace("Line start before {} found at {}", offset, line_start);
      return true;
    }
    pos = start;
  }
  line_start = 0;
  return true;
}

bool LineScanner::scan_down(std::uint64_t from, size_t wanted, WindowState& state,
                            std::vector<std::string>& out, std::string& msg) {
  std::uint64_t size = src_.size();
  std::uint64_t pos = from;
  std::string carry;
  auto record = [&](std::string line, std::uint64_t end) {
    if (state.starts.full()) { state.starts.pop_front(); state.lines.pop_front(); }
    state.starts.push_back(end);
    state.lines.push_back(line);
    out.push_back(std::move(line));
  };

  while (out.size() < wanted && pos < size) {
    size_t len = static_cast<size_t>(std::min<std::uint64_t>(chunk_size_, size - pos));
    buf_.resize(len);
    size_t got = 0;
    spdlog::trace("Reading chunk {}..{}", pos, pos + len);
    if (!src_.read_at(pos, buf_.data(), len, got, msg)) return false;
    if (got < len) {
      // truncated under us: the last byte we can see ends the file
      spdlog::trace("Did not read full chunk, chunk that got read is {}..{}", pos, pos + got);
      size = pos + got;
      if (got == 0) {
        if (!carry.empty()) record(std::move(carry), pos);
        break;
      }
    }
    ForwardStep step = scan_forward_chunk(std::string_view(buf_.data(), got), pos, size,
                                          wanted - out.size(), std::move(carry));
    for (size_t i = 0; i < step.lines.size(); ++i) {
      spdlog::trace("Found line ending at {}, {} bytes", step.ends[i], step.lines[i].size());
      record(std::move(step.lines[i]), step.ends[i]);
    }
    if (step.done) break;
    carry = std::move(step.carry);
    pos += got;
  }
  return true;
}

bool LineScanner::scan_up(std::uint64_t boundary, size_t wanted, WindowState& state,
                          std::vector<std::string>& out, std::string& msg) {
  std::uint64_t pos = std::min(boundary, src_.size());
  if (pos == 0 || wanted == 0) return true;

  std::vector<std::string> found;  // nearest to the boundary first
  std::string carry;
  bool first_chunk = true;
  while (true) {
    std::uint64_t start = pos > chunk_size_ ? pos - chunk_size_ : 0;
    spdlog::trace("Reading chunk {}:{}, previous start: {}", start, pos, pos);
    if (!read_exact(start, static_cast<size_t>(pos - start), msg)) return false;
    std::string_view chunk(buf_.data(), buf_.size());
    if (first_chunk) {
      // delimiter terminating the line just before the boundary
      if (!chunk.empty() && chunk.back() == kLineDelimiter) chunk.remove_suffix(1);
      first_chunk = false;
    }
    BackwardStep step = scan_backward_chunk(chunk, start, wanted - found.size(), std::move(carry));
    for (size_t i = 0; i < step.lines.size(); ++i) {
      spdlog::trace("Found line starting at {}, {} bytes", step.starts[i], step.lines[i].size());
      if (state.starts.full()) { state.starts.pop_back(); state.lines.pop_back(); }
      state.starts.push_front(step.starts[i]);
      state.lines.push_front(step.lines[i]);
      found.push_back(std::move(step.lines[i]));
    }
    if (step.done || start == 0) break;
    carry = std::move(step.carry);
    pos = start;
  }
  out.insert(out.end(), std::make_move_iterator(found.rbegin()), std::make_move_iterator(found.rend()));
  return true;
}
