#pragma once
/*
 * Renderer
 *
 * Purpose: draw the pager screen: visible lines (horizontally scrolled) and the status/command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Pager to render.
 */
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "iterminal.hpp"

struct PagerRenderInfo {
  const std::vector<std::string>* lines = nullptr;
  int left_col = 0;
  std::filesystem::path file_path;
  std::uint64_t first_offset = 0;
  std::uint64_t last_offset = 0;
  bool follow = false;
  bool command_mode = false;
  std::string cmdline;
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const PagerRenderInfo& info);
};

// Tabs expanded to the next multiple of 8; other control bytes (e.g. a kept '\r') shown as '?'.
std::string printable_line(const std::string& s);
