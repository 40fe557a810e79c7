#pragma once
/*
 * Pager
 *
 * Purpose: interactive viewer over an IFileContentReader: pages through the file,
 *          jumps to top/tail, follows a growing file by polling.
 * Input: normal keys (g G j k b Space r F q h l and the arrow/page keys) and a ':'
 *        command line dispatched through CommandRegistry.
 * Note: the screen always shows the reader's last successful result; a failed call
 *       keeps the old screen and reports the reason on the status line.
 */
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "i_file_content_reader.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "viewer_options.hpp"

class Pager {
public:
  // page_lines: lines per page; normally the reader's window size.
  Pager(IFileContentReader& reader, ITerminal& term, size_t page_lines, const ViewerOptions& opts);
  void run();

  // One input step; kNoKey means the poll interval passed without input.
  void handle_key(int ch);
  void render();

  void go_top();
  void go_tail();
  void page_down();
  void page_up();
  void do_refresh();
  void poll();

  const std::vector<std::string>& screen() const { return screen_; }
  const std::string& message() const { return message_; }
  bool following() const { return follow_; }
  bool should_quit() const { return should_quit_; }
  int poll_ms() const { return poll_ms_; }
  int left_col() const { return left_col_; }
  bool in_command_mode() const { return command_mode_; }

private:
  void register_commands();
  void execute_command();
  void handle_normal_key(int ch);
  void handle_command_key(int ch);
  // false when the result was unavailable; the screen is left as it was
  bool show(const LinesResult& r);

  IFileContentReader& reader_;
  ITerminal& term_;
  size_t page_lines_;
  int poll_ms_;
  bool follow_;
  bool should_quit_ = false;
  bool unavailable_ = false;  // message_ holds an unavailable reason
  bool command_mode_ = false;
  int left_col_ = 0;
  std::vector<std::string> screen_;
  std::string message_;
  std::string cmdline_;
  Renderer renderer_;
  CommandRegistry registry_;
};
