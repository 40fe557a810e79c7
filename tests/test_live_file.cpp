#include "windowed_line_reader.hpp"
#include "test_support.hpp"
#include <cassert>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static void test_growth_keeps_anchor() {
  for (size_t c : {size_t(1), size_t(5), size_t(4096)}) {
    TempFile f(numbered_lines(5));
    WindowedLineReader r(ReaderConfig{f.path(), 3, c});
    auto t = r.tail();
    assert(t && (*t == numbered(3, 5)));
    f.append(numbered_lines(7).substr(numbered_lines(5).size()));
    auto rf = r.refresh();
    assert(rf && (*rf == numbered(3, 5)));
    auto tl = r.tail();
    assert(tl && (*tl == numbered(5, 7)));
  }
}

static void test_growth_fills_short_window() {
  TempFile f(numbered_lines(2));
  WindowedLineReader r(ReaderConfig{f.path(), 4, 3});
  auto t = r.top();
  assert(t && (*t == numbered(1, 2)));
  f.write(numbered_lines(6));
  auto rf = r.refresh();
  assert(rf && (*rf == numbered(1, 4)));
}

static void test_move_down_sees_appended_lines() {
  TempFile f(numbered_lines(4));
  WindowedLineReader r(ReaderConfig{f.path(), 4, 4096});
  assert(r.top());
  auto d = r.move_down(4);
  assert(d && d->empty());
  f.append("line5\nline6");
  auto d2 = r.move_down(4);
  assert(d2 && (*d2 == numbered(5, 6)));
}

static void test_partial_last_line_completed() {
  TempFile f("one\ntw");
  WindowedLineReader r(ReaderConfig{f.path(), 3, 2});
  auto t = r.tail();
  assert(t && (*t == Lines{"one", "tw"}));
  f.append("o\nthree\n");
  auto rf = r.refresh();
  assert(rf && (*rf == Lines{"one", "two", "three"}));
}

static void test_truncation_backfills() {
  for (size_t c : {size_t(1), size_t(4), size_t(4096)}) {
    TempFile f(numbered_lines(10));
    WindowedLineReader r(ReaderConfig{f.path(), 4, c});
    auto t = r.tail();
    assert(t && (*t == numbered(7, 10)));
    f.write(numbered_lines(8));
    auto rf = r.refresh();
    assert(rf && (*rf == numbered(5, 8)));
    assert((Lines(r.window().begin(), r.window().end()) == numbered(5, 8)));
    assert(r.line_starts().last() == numbered_lines(8).size());

    // truncated before the window's first line: the anchor resolves to the end
    f.write(numbered_lines(2));
    auto rf2 = r.refresh();
    assert(rf2 && (*rf2 == numbered(1, 2)));

    f.write("");
    auto rf3 = r.refresh();
    assert(rf3 && rf3->empty());
  }
}

static void test_rewrite_realigns_to_line_start() {
  TempFile f(numbered_lines(6));
  WindowedLineReader r(ReaderConfig{f.path(), 2, 3});
  r.top();
  auto d = r.move_down(2);
  assert(d && (*d == numbered(3, 4)));
  // the old anchor now points into the middle of a longer line
  f.write("aaaaaaaaaaaaaaaaaaaa\nbb\ncc\n");
  auto rf = r.refresh();
  assert(rf && (*rf == Lines{"aaaaaaaaaaaaaaaaaaaa", "bb"}));
  assert(r.line_starts().first() == 0);
}

int main() {
  test_growth_keeps_anchor();
  test_growth_fills_short_window();
  test_move_down_sees_appended_lines();
  test_partial_last_line_completed();
  test_truncation_backfills();
  test_rewrite_realigns_to_line_start();
  return 0;
}
