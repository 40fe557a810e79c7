#include "pager.hpp"
#include <ncurses.h>
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>

static constexpr int ESC = 27;

Pager::Pager(IFileContentReader& reader, ITerminal& term, size_t page_lines, const ViewerOptions& opts)
    : reader_(reader), term_(term), page_lines_(std::max<size_t>(1, page_lines)),
      poll_ms_(opts.poll_ms), follow_(opts.follow) {
  register_commands();
}

void Pager::run() {
  if (follow_) go_tail(); else go_top();
  while (!should_quit_) {
    render();
    handle_key(term_.read_key(poll_ms_));
  }
}

void Pager::render() {
  PagerRenderInfo info;
  info.lines = &screen_;
  info.left_col = left_col_;
  info.file_path = reader_.file();
  info.first_offset = reader_.line_starts().first();
  info.last_offset = reader_.line_starts().last();
  info.follow = follow_;
  info.command_mode = command_mode_;
  info.cmdline = cmdline_;
  info.message = message_;
  renderer_.render(term_, info);
}

bool Pager::show(const LinesResult& r) {
  if (!r) {
    message_ = "file unavailable: " + reader_.last_error();
    unavailable_ = true;
    return false;
  }
  screen_ = *r;
  if (unavailable_) { message_.clear(); unavailable_ = false; }
  return true;
}

void Pager::go_top() {
  follow_ = false;
  if (show(reader_.top()) && screen_.empty()) message_ = "empty file";
}

void Pager::go_tail() {
  follow_ = true;
  if (show(reader_.tail()) && screen_.empty()) message_ = "empty file";
}

void Pager::page_down() {
  LinesResult r = reader_.move_down(page_lines_);
  if (!r) { show(r); return; }
  if (r->empty()) { message_ = "end of file"; return; }
  if (r->size() < page_lines_) {
    // keep the screen full: the short page becomes the anchor of a refresh
    LinesResult full = reader_.refresh();
    if (full) { show(full); return; }
    show(r);
    message_ = "file unavailable: " + reader_.last_error();
    unavailable_ = true;
    return;
  }
  show(r);
}

void Pager::page_up() {
  follow_ = false;
  LinesResult r = reader_.move_up(page_lines_);
  if (!r) { show(r); return; }
  if (r->empty()) { message_ = "top of file"; return; }
  if (r->size() < page_lines_) {
    LinesResult full = reader_.refresh();
    if (full) { show(full); return; }
    show(r);
    message_ = "file unavailable: " + reader_.last_error();
    unavailable_ = true;
    return;
  }
  show(r);
}

void Pager::do_refresh() {
  show(reader_.refresh());
}

void Pager::poll() {
  spdlog::trace("poll (follow={})", follow_);
  if (follow_) show(reader_.tail());
  else show(reader_.refresh());
}

void Pager::handle_key(int ch) {
  if (ch == kNoKey) { poll(); return; }
  if (command_mode_) handle_command_key(ch);
  else handle_normal_key(ch);
}

void Pager::handle_normal_key(int ch) {
  int step = std::max(1, term_.get_size().cols / 2);
  message_.clear();
  unavailable_ = false;
  switch (ch) {
    case 'q': should_quit_ = true; break;
    case 'g': case KEY_HOME: go_top(); break;
    case 'G': case KEY_END: go_tail(); break;
    case ' ': case 'j': case KEY_NPAGE: case KEY_DOWN: page_down(); break;
    case 'b': case 'k': case KEY_PPAGE: case KEY_UP: page_up(); break;
    case 'r': do_refresh(); break;
    case 'F':
      if (follow_) { follow_ = false; message_ = "follow off"; }
      else { go_tail(); if (!unavailable_) message_ = "follow on"; }
      break;
    case 'h': case KEY_LEFT: left_col_ = std::max(0, left_col_ - step); break;
    case 'l': case KEY_RIGHT: left_col_ += step; break;
    case ':': command_mode_ = true; cmdline_.clear(); break;
    default: break;
  }
}

void Pager::handle_command_key(int ch) {
  if (ch == ESC) { command_mode_ = false; return; }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline_.empty()) { command_mode_ = false; return; }
    cmdline_.pop_back();
    return;
  }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') { command_mode_ = false; execute_command(); return; }
  if (ch >= 32 && ch <= 126) { cmdline_.push_back((char)ch); }
}

void Pager::register_commands() {
  registry_.register_command("q", [this](const std::vector<std::string>&){ should_quit_ = true; });
  registry_.register_alias("quit", "q");
  registry_.register_command("top", [this](const std::vector<std::string>&){ go_top(); });
  registry_.register_command("tail", [this](const std::vector<std::string>&){ go_tail(); });
  registry_.register_command("refresh", [this](const std::vector<std::string>&){ do_refresh(); });
  registry_.register_command("set follow", [this](const std::vector<std::string>& args){
    bool on = !follow_;
    if (!args.empty()) {
      ViewerOptions tmp;
      std::string mm;
      if (!apply_option(tmp, "follow", args[0], mm)) { message_ = mm; return; }
      on = tmp.follow;
    }
    if (on) { go_tail(); if (!unavailable_) message_ = "follow on"; }
    else { follow_ = false; message_ = "follow off"; }
  });
  registry_.register_command("help", [this](const std::vector<std::string>&){
    std::string list;
    for (const auto& n : registry_.names()) { if (!list.empty()) list += ", "; list += n; }
    message_ = "commands: " + list;
  });
  registry_.register_command("set nofollow", [this](const std::vector<std::string>&){
    follow_ = false; message_ = "follow off";
  });
  registry_.register_command("set poll", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "poll=" + std::to_string(poll_ms_); return; }
    ViewerOptions tmp;
    std::string mm;
    if (!apply_option(tmp, "poll", args[0], mm)) { message_ = mm; return; }
    poll_ms_ = tmp.poll_ms;
    message_ = "poll=" + std::to_string(poll_ms_);
  });
}

void Pager::execute_command() {
  std::istringstream iss(cmdline_);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd.empty()) return;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry_.execute(composite, subargs)) { message_ = "unknown command: " + composite; }
    return;
  }
  if (!registry_.execute(cmd, args)) { message_ = "unknown command: " + cmd; }
}
