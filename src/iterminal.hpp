#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, status line, refresh, key input).
 * Goal: decouple the pager from ncurses so it can be driven headless in tests.
 */
#include <string>

struct TermSize { int rows; int cols; };

// read_key result when the timeout expired without input
constexpr int kNoKey = -1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_status(int row, const std::string& text) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void refresh() = 0;
  // Blocks up to timeout_ms (< 0: forever); kNoKey on timeout.
  virtual int read_key(int timeout_ms) = 0;
};
