#include "pager.hpp"
#include "headless_terminal.hpp"
#include "windowed_line_reader.hpp"
#include "test_support.hpp"
#include <cassert>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static void type(Pager& p, const std::string& keys) {
  for (unsigned char c : keys) p.handle_key(c);
}

static void test_paging() {
  TempFile f(numbered_lines(10, "l"));
  HeadlessTerminal term(5, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 6});
  ViewerOptions opts;
  Pager p(reader, term, 4, opts);

  p.go_top();
  assert((p.screen() == numbered(1, 4, "l")));
  p.handle_key(' ');
  assert((p.screen() == numbered(5, 8, "l")));
  // last page is short: refilled from above
  p.handle_key('j');
  assert((p.screen() == numbered(7, 10, "l")));
  p.handle_key('j');
  assert((p.screen() == numbered(7, 10, "l")));
  assert(p.message() == "end of file");

  p.handle_key('b');
  assert((p.screen() == numbered(3, 6, "l")));
  p.handle_key('k');
  assert((p.screen() == numbered(1, 4, "l")));
  p.handle_key('k');
  assert(p.message() == "top of file");

  p.handle_key('G');
  assert((p.screen() == numbered(7, 10, "l")));
  assert(p.following());
  p.handle_key('g');
  assert((p.screen() == numbered(1, 4, "l")));
  assert(!p.following());
}

static void test_follow_polls_tail() {
  TempFile f(numbered_lines(6, "l"));
  HeadlessTerminal term(5, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 4096});
  ViewerOptions opts;
  opts.follow = true;
  Pager p(reader, term, 4, opts);
  p.go_tail();
  assert((p.screen() == numbered(3, 6, "l")));
  f.append("l7\nl8\n");
  p.handle_key(kNoKey);
  assert((p.screen() == numbered(5, 8, "l")));

  // paging up leaves follow mode; polling then only refreshes in place
  p.handle_key('b');
  assert(!p.following());
  assert((p.screen() == numbered(1, 4, "l")));
  f.append("l9\n");
  p.handle_key(kNoKey);
  assert((p.screen() == numbered(1, 4, "l")));

  p.handle_key('F');
  assert(p.following());
  assert((p.screen() == numbered(6, 9, "l")));
  p.handle_key('F');
  assert(!p.following());
}

static void test_commands() {
  TempFile f(numbered_lines(8, "l"));
  HeadlessTerminal term(5, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 4096});
  ViewerOptions opts;
  Pager p(reader, term, 4, opts);
  p.go_top();

  type(p, ":set poll=250\n");
  assert(!p.in_command_mode());
  assert(p.poll_ms() == 250);
  type(p, ":set poll 5\n");
  assert(p.poll_ms() == 250);
  assert(p.message() == "set poll: interval must be 10..3600000 ms");
  type(p, ":tail\n");
  assert((p.screen() == numbered(5, 8, "l")));
  assert(p.following());
  type(p, ":set follow off\n");
  assert(!p.following());
  type(p, ":top\n");
  assert((p.screen() == numbered(1, 4, "l")));
  type(p, ":bogus\n");
  assert(p.message() == "unknown command: bogus");
  type(p, ":set bogus=1\n");
  assert(p.message() == "unknown command: set bogus");

  type(p, ":help\n");
  assert(p.message().rfind("commands: ", 0) == 0);
  assert(p.message().find("set poll") != std::string::npos);
  assert(p.message().find("quit") == std::string::npos);

  // escape and backspace on an empty line leave command mode without running anything
  type(p, ":q");
  p.handle_key(27);
  assert(!p.in_command_mode() && !p.should_quit());
  type(p, ":");
  p.handle_key(127);
  assert(!p.in_command_mode());

  type(p, ":qx");
  p.handle_key(127);
  type(p, "\n");
  assert(p.should_quit());
}

static void test_quit_alias() {
  TempFile f("x\n");
  HeadlessTerminal term(5, 80);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 4096});
  ViewerOptions opts;
  Pager p(reader, term, 4, opts);
  type(p, ":quit\n");
  assert(p.should_quit());
}

static void test_unavailable_keeps_screen() {
  TempFile f(numbered_lines(3, "l"));
  HeadlessTerminal term(5, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 4096});
  ViewerOptions opts;
  Pager p(reader, term, 4, opts);
  p.go_top();
  f.remove();
  p.handle_key('r');
  assert(p.message().rfind("file unavailable: ", 0) == 0);
  assert((p.screen() == numbered(1, 3, "l")));
  f.write(numbered_lines(4, "l"));
  p.handle_key(kNoKey);
  assert(p.message().empty());
  assert((p.screen() == numbered(1, 4, "l")));
}

static void test_render() {
  TempFile f("a\tb\nsecond line\n");
  HeadlessTerminal term(4, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 3, 4096});
  ViewerOptions opts;
  Pager p(reader, term, 3, opts);
  p.go_top();
  p.render();
  assert(term.row(0) == "a       b");
  assert(term.row(1) == "second line");
  assert(term.row(2) == "~");
  assert(term.row(3).find(f.path().string()) == 0);
  assert(term.row(3).find("lines:2") != std::string::npos);
  assert(term.row(3).find("bytes:0-16") != std::string::npos);

  p.handle_key('l');
  assert(p.left_col() == 100);
  p.render();
  assert(term.row(1).empty());
  p.handle_key('h');
  assert(p.left_col() == 0);

  type(p, ":set fo");
  p.render();
  assert(term.row(3) == ":set fo");
}

static void test_run_loop() {
  TempFile f(numbered_lines(10, "l"));
  HeadlessTerminal term(5, 200);
  WindowedLineReader reader(ReaderConfig{f.path(), 4, 16});
  ViewerOptions opts;
  Pager p(reader, term, 4, opts);
  term.push_keys("  q");
  p.run();
  assert(p.should_quit());
  assert((p.screen() == numbered(7, 10, "l")));
  assert(term.refreshes() == 3);
}

int main() {
  test_paging();
  test_follow_polls_tail();
  test_commands();
  test_quit_alias();
  test_unavailable_keeps_screen();
  test_render();
  test_run_loop();
  return 0;
}
