#include "terminal.hpp"
#include <cstdlib>
#include <locale.h>
#include <stdexcept>
#include <string>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* term = std::getenv("TERM");
    throw std::runtime_error(std::string("can not initialize terminal, TERM=") + (term ? term : "(unset)"));
  }
  set_term(screen_);
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  set_escdelay(25);
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
