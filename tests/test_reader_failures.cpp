#include "windowed_line_reader.hpp"
#include "memory_byte_source.hpp"
#include "test_support.hpp"
#include <cassert>
#include <map>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

// In-memory stand-in for the file system. Every reader call opens the "file" once per
// scan; fail_on_open maps the n-th open to the read that should fail on that source.
struct FakeFile {
  std::string data;
  bool missing = false;
  int opens = 0;
  std::map<int, int> fail_on_open;

  ByteSourceFactory factory() {
    return [this](const std::filesystem::path& p, std::string& msg) -> std::unique_ptr<IByteSource> {
      int n = opens++;
      if (missing) { msg = "not a regular file: " + p.string(); return nullptr; }
      auto it = fail_on_open.find(n);
      return std::make_unique<MemoryByteSource>(data, it == fail_on_open.end() ? -1 : it->second);
    };
  }
  // the next open fails on its first read
  void fail_next_read() { fail_on_open[opens] = 0; }
};

static Lines window_of(const WindowedLineReader& r) { return Lines(r.window().begin(), r.window().end()); }

static void test_read_failure_keeps_state() {
  FakeFile f;
  f.data = numbered_lines(20);
  WindowedLineReader r(ReaderConfig{"fake.log", 4, 8}, f.factory());
  auto t = r.top();
  assert(t && (*t == numbered(1, 4)));
  std::string starts = r.line_starts().to_string();
  Lines win = window_of(r);

  f.fail_next_read();
  assert(!r.move_down(4));
  assert(r.last_error() == "injected read failure");
  assert(r.line_starts().to_string() == starts && window_of(r) == win);

  f.fail_next_read();
  assert(!r.tail());
  assert(r.line_starts().to_string() == starts && window_of(r) == win);

  f.fail_next_read();
  assert(!r.top());
  assert(r.line_starts().to_string() == starts && window_of(r) == win);

  // a failure after some lines were already found still leaves nothing behind
  f.fail_on_open[f.opens] = 2;
  assert(!r.move_down(4));
  assert(r.line_starts().to_string() == starts && window_of(r) == win);

  auto d = r.move_down(4);
  assert(d && (*d == numbered(5, 8)));
}

static void test_move_up_failure_keeps_state() {
  FakeFile f;
  f.data = numbered_lines(20);
  WindowedLineReader r(ReaderConfig{"fake.log", 4, 5}, f.factory());
  assert(r.tail());
  std::string starts = r.line_starts().to_string();
  f.fail_on_open[f.opens] = 1;
  assert(!r.move_up(4));
  assert(r.line_starts().to_string() == starts);
  auto u = r.move_up(4);
  assert(u && (*u == numbered(13, 16)));
}

static void test_refresh_backfill_failure_commits_forward_half() {
  FakeFile f;
  f.data = numbered_lines(10);
  WindowedLineReader r(ReaderConfig{"fake.log", 4, 4096}, f.factory());
  assert(r.tail());
  assert((window_of(r) == numbered(7, 10)));
  f.data = numbered_lines(8);  // truncated: the window's first line is now the last-but-one
  // forward half is open n, the backfill is open n + 1
  f.fail_on_open[f.opens + 1] = 0;
  auto rf = r.refresh();
  assert(rf && (*rf == numbered(7, 8)));
  assert((window_of(r) == numbered(7, 8)));
  // without the failure the window fills up again
  auto rf2 = r.refresh();
  assert(rf2 && (*rf2 == numbered(5, 8)));
}

static void test_unavailable_source() {
  FakeFile f;
  f.data = "a\nb\n";
  WindowedLineReader r(ReaderConfig{"gone.log", 4, 16}, f.factory());
  assert(r.top());
  f.missing = true;
  assert(!r.top());
  assert(!r.tail());
  assert(!r.refresh());
  assert(!r.move_up(1));
  assert(!r.move_down(1));
  assert(r.last_error() == "not a regular file: gone.log");
  assert((window_of(r) == Lines{"a", "b"}));
  f.missing = false;
  assert(r.refresh());
}

static void test_real_paths() {
  auto dir = std::filesystem::temp_directory_path();
  WindowedLineReader on_dir(ReaderConfig{dir, 4, 16});
  assert(!on_dir.top());
  assert(on_dir.last_error().find("not a regular file") != std::string::npos);

  TempFile f("x\n");
  WindowedLineReader r(ReaderConfig{f.path(), 4, 16});
  assert(r.top());
  f.remove();
  assert(!r.refresh());
  assert(!r.last_error().empty());
  assert((window_of(r) == Lines{"x"}));
}

int main() {
  test_read_failure_keeps_state();
  test_move_up_failure_keeps_state();
  test_refresh_backfill_failure_commits_forward_half();
  test_unavailable_source();
  test_real_paths();
  return 0;
}
