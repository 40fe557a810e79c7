#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, -1, -1); // text: default colors
    } else {
      init_pair(1, COLOR_WHITE, COLOR_BLACK); // fallback
    }
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  int room = std::max(0, get_size().cols - col);
  if (room == 0) return;
  if (has_colors()) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), std::min(room, (int)text.size()));
  if (has_colors()) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_status(int row, const std::string& text) {
  int cols = get_size().cols;
  std::string line = text.substr(0, std::min<size_t>(text.size(), (size_t)std::max(0, cols)));
  line.resize(std::max(0, cols), ' ');
  attron(A_REVERSE);
  mvaddnstr(row, 0, line.c_str(), (int)line.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::refresh() { ::refresh(); }

int NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  int ch = getch();
  return ch == ERR ? kNoKey : ch;
}
