#pragma once
/*
 * LineScanner
 *
 * Purpose: read chunks from an IByteSource and feed them through ChunkScan, in either
 *          direction, recording every line found in a WindowState.
 * Usage: one scanner per reader operation, bound to the source opened for that operation.
 * Note: returns false with msg on I/O failure; the WindowState may then hold a partial
 *       scan, so callers pass a scratch copy and keep it only on success.
 */
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "byte_source.hpp"
#include "line_start_index.hpp"

// Lines held by a reader plus the offsets that bound them.
// starts.size() == lines.size() + 1 whenever starts is not empty.
struct WindowState {
  explicit WindowState(size_t window_size) : starts(window_size + 1) {}
  LineStartIndex starts;
  std::deque<std::string> lines;
};

class LineScanner {
public:
  LineScanner(IByteSource& src, size_t chunk_size) : src_(src), chunk_size_(chunk_size) {}

  // Offset of the start of the line containing `offset`: 0, the byte after the nearest
  // delimiter before it, or the source size for offsets at or past the end.
  bool resolve_line_start(std::uint64_t offset, std::uint64_t& line_start, std::string& msg);

  // Reads up to `wanted` lines starting at `from` (a line start). Each line's end offset
  // is pushed onto the back of state; when full, the front is evicted.
  bool scan_down(std::uint64_t from, size_t wanted, WindowState& state,
                 std::vector<std::string>& out, std::string& msg);

  // Reads up to `wanted` lines ending before `boundary` (a line start or the source size),
  // excluding the delimiter just before it. Each line's start is pushed onto the front of
  // state; when full, the back is evicted. `out` is in file order.
  bool scan_up(std::uint64_t boundary, size_t wanted, WindowState& state,
               std::vector<std::string>& out, std::string& msg);

private:
  bool read_exact(std::uint64_t offset, size_t len, std::string& msg);

  IByteSource& src_;
  size_t chunk_size_;
  std::vector<char> buf_;
};
