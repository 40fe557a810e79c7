#pragma once
/*
 * WindowedLineReader
 *
 * Purpose: memory-bounded window over the lines of a large, possibly growing file.
 *          Holds at most window_size lines and the window_size + 1 offsets around them;
 *          never reads the whole file.
 * Modes: Refresh operations (top/tail/refresh) rebuild the window from an anchor offset;
 *        Move operations (move_up/move_down) continue from the current window's edge and
 *        trust the offsets recorded by the previous call.
 * Constraint: single-threaded; one call in flight per instance. The file is opened and
 *             closed inside every call. A failed call leaves the window untouched.
 * Note: refresh() may read twice (forward, then a backward fill); if another process
 *       writes between the two reads the halves can disagree. No locking is attempted.
 */
#include <deque>
#include <filesystem>
#include <limits>
#include <string>
#include "byte_source.hpp"
#include "config.hpp"
#include "i_file_content_reader.hpp"
#include "line_scanner.hpp"
#include "line_start_index.hpp"

struct ReaderConfig {
  std::filesystem::path file;
  size_t window_size = LP_DEFAULT_WINDOW_SIZE;
  size_t chunk_size = LP_DEFAULT_CHUNK_SIZE;
};

class WindowedLineReader : public IFileContentReader {
public:
  // Throws std::invalid_argument when window_size or chunk_size is 0.
  explicit WindowedLineReader(ReaderConfig cfg);
  WindowedLineReader(ReaderConfig cfg, ByteSourceFactory open_source);

  LinesResult top() override;
  LinesResult tail() override;
  LinesResult move_up(size_t lines) override;
  LinesResult move_down(size_t lines) override;
  LinesResult refresh() override;
  const std::filesystem::path& file() const override { return cfg_.file; }

  size_t window_size() const { return cfg_.window_size; }
  size_t chunk_size() const { return cfg_.chunk_size; }
  const LineStartIndex& line_starts() const override { return state_.starts; }
  const std::deque<std::string>& window() const { return state_.lines; }
  const std::string& last_error() const override { return last_error_; }

private:
  enum class LoadMode { Move, Refresh };
  // resolves to the file's length at the time of the call
  static constexpr std::uint64_t kEndOfFile = std::numeric_limits<std::uint64_t>::max();

  LinesResult load_from_top(std::uint64_t offset, size_t lines, LoadMode mode, WindowState& state);
  LinesResult load_from_bottom(std::uint64_t boundary, size_t lines, LoadMode mode, WindowState& state);
  LinesResult unavailable(const std::string& msg);

  ReaderConfig cfg_;
  ByteSourceFactory open_source_;
  WindowState state_;
  std::string last_error_;
};
