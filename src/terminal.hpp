#pragma once
/*
 * Terminal
 *
 * Purpose: RAII owner of the ncurses screen: init on construction, restore on destruction.
 * Usage: construct in main before any NcursesTerminal.
 * Note: throws std::runtime_error when no terminal can be set up (TERM unset, not a tty),
 *       instead of letting ncurses exit the process.
 * Note: a pager never edits, so cbreak (not raw) keeps Ctrl-C working.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  SCREEN* screen_ = nullptr;
};
