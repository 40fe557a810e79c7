#pragma once
/*
 * ChunkScan
 *
 * Purpose: split one chunk of file bytes into lines, in either direction.
 * Principle: no I/O and no reader state; the partial line crossing a chunk edge is
 *            passed in as `carry` and handed back in the result, so a scan is a fold
 *            of these steps over the chunks a byte source produces.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

constexpr char kLineDelimiter = '\n';

struct ForwardStep {
  std::vector<std::string> lines;
  std::vector<std::uint64_t> ends;  // offset just after each line's delimiter (or final byte)
  std::string carry;                // prefix of the next, not yet terminated, line
  bool done = false;                // `wanted` lines emitted or the file's final byte consumed
};

struct BackwardStep {
  std::vector<std::string> lines;     // nearest to the scan position first
  std::vector<std::uint64_t> starts;  // start offset of each line
  std::string carry;                  // tail of a line whose start is in an earlier chunk
  bool done = false;                  // `wanted` lines emitted or file offset 0 reached
};

// chunk holds the bytes at [chunk_offset, chunk_offset + chunk.size()); the byte at
// file_size - 1 ends the last line even without a delimiter.
ForwardStep scan_forward_chunk(std::string_view chunk, std::uint64_t chunk_offset,
                               std::uint64_t file_size, size_t wanted, std::string carry);

// Scans chunk in reverse. The chunk must end where the previous (more recent) step
// started, or at the content end of the scan for the first step.
BackwardStep scan_backward_chunk(std::string_view chunk, std::uint64_t chunk_offset,
                                 size_t wanted, std::string carry);
