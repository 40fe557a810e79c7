#pragma once
/*
 * ViewerOptions
 *
 * Purpose: settings of the logpager viewer, layered as defaults < ~/.logpagerrc < argv.
 * Format: rc lines are ex-style `set name=value` or `set name` (flag on); blank lines and
 *         lines starting with #, " or // are skipped, a leading ':' is allowed.
 * Names: window, chunk, follow, nofollow, poll, log, loglevel.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "config.hpp"

struct ViewerOptions {
  std::optional<std::filesystem::path> file;
  size_t window_size = 0;  // 0: fit the terminal
  size_t chunk_size = LP_DEFAULT_CHUNK_SIZE;
  bool follow = false;
  int poll_ms = LP_DEFAULT_POLL_MS;
  std::optional<std::filesystem::path> log_file;
  std::string log_level = "info";
  bool help = false;
};

bool apply_option(ViewerOptions& opts, const std::string& name, const std::string& value, std::string& msg);
// Parses one rc/command line ("set window=200"). Empty and comment lines are accepted as no-ops.
bool apply_rc_line(ViewerOptions& opts, const std::string& line, std::string& msg);
// A missing rc file is not an error. On a bad line, msg names it and the remaining lines still apply.
bool load_rc_file(const std::filesystem::path& path, ViewerOptions& opts, std::string& msg);
std::optional<std::filesystem::path> default_rc_path();
bool parse_args(int argc, char** argv, ViewerOptions& opts, std::string& msg);
std::string usage(const char* argv0);
