#pragma once
/*
 * IFileContentReader
 *
 * Purpose: what a viewer needs from a file: a bounded window of lines that can be moved
 *          to the top/bottom, scrolled up/down, and resynchronized after the file changed.
 * Result: lines read, or std::nullopt when the file is unavailable (not a regular file,
 *         I/O error). An empty vector means there was nothing to read.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "line_start_index.hpp"

using LinesResult = std::optional<std::vector<std::string>>;

class IFileContentReader {
public:
  virtual ~IFileContentReader() = default;
  virtual LinesResult top() = 0;
  virtual LinesResult tail() = 0;
  virtual LinesResult move_up(size_t lines) = 0;
  virtual LinesResult move_down(size_t lines) = 0;
  virtual LinesResult refresh() = 0;
  virtual const std::filesystem::path& file() const = 0;
  // boundaries of the current window
  virtual const LineStartIndex& line_starts() const = 0;
  // why the last unavailable result was unavailable
  virtual const std::string& last_error() const = 0;
};
