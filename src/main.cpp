#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "logging.hpp"
#include "pager.hpp"
#include "viewer_options.hpp"
#include "windowed_line_reader.hpp"
#include <algorithm>
#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  ViewerOptions opts;
  std::string msg;
  std::string rc_msg;
  if (auto rc = default_rc_path()) {
    if (!load_rc_file(*rc, opts, rc_msg)) std::cerr << "logpager: " << rc_msg << "\n";
  }
  if (!parse_args(argc, argv, opts, msg)) {
    std::cerr << "logpager: " << msg << "\n" << usage(argv[0]);
    return 2;
  }
  if (opts.help) { std::cout << usage(argv[0]); return 0; }
  if (!setup_logging(opts, msg)) {
    std::cerr << "logpager: " << msg << "\n";
    return 1;
  }

  try {
    Terminal term;
    NcursesTerminal screen;
    size_t window = opts.window_size;
    if (window == 0) window = static_cast<size_t>(std::max(1, screen.get_size().rows - 1));
    spdlog::info("viewing {} (window={} chunk={} follow={})", opts.file->string(), window, opts.chunk_size, opts.follow);
    WindowedLineReader reader(ReaderConfig{*opts.file, window, opts.chunk_size});
    Pager pager(reader, screen, window, opts);
    pager.run();
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    std::cerr << "logpager: " << e.what() << "\n";
    return 1;
  }
  spdlog::shutdown();
  return 0;
}
