#include "windowed_line_reader.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include "posix_byte_source.hpp"

static const ReaderConfig& validated(const ReaderConfig& cfg) {
  if (cfg.window_size == 0) throw std::invalid_argument("window size must be > 0");
  if (cfg.chunk_size == 0) throw std::invalid_argument("chunk size must be > 0");
  return cfg;
}

WindowedLineReader::WindowedLineReader(ReaderConfig cfg)
  : WindowedLineReader(std::move(cfg), &PosixByteSource::open) {}

WindowedLineReader::WindowedLineReader(ReaderConfig cfg, ByteSourceFactory open_source)
  : cfg_(validated(cfg)),
    open_source_(std::move(open_source)),
    state_(cfg_.window_size) {}

LinesResult WindowedLineReader::move_up(size_t lines) {
  WindowState next(cfg_.window_size);
  LinesResult r = load_from_bottom(state_.starts.first(), lines, LoadMode::Move, next);
  if (r && !r->empty()) state_ = std::move(next);
  return r;
}

LinesResult WindowedLineReader::move_down(size_t lines) {
  WindowState next(cfg_.window_size);
  LinesResult r = load_from_top(state_.starts.last(), lines, LoadMode::Move, next);
  if (r && !r->empty()) state_ = std::move(next);
  return r;
}

LinesResult WindowedLineReader::top() {
  WindowState next(cfg_.window_size);
  LinesResult r = load_from_top(0, cfg_.window_size, LoadMode::Refresh, next);
  if (r) state_ = std::move(next);
  return r;
}

LinesResult WindowedLineReader::tail() {
  WindowState next(cfg_.window_size);
  LinesResult r = load_from_bottom(kEndOfFile, cfg_.window_size, LoadMode::Refresh, next);
  if (r) state_ = std::move(next);
  return r;
}

LinesResult WindowedLineReader::refresh() {
  WindowState next(cfg_.window_size);
  LinesResult from_top = load_from_top(state_.starts.first(), cfg_.window_size, LoadMode::Refresh, next);
  if (!from_top) return from_top;
  if (from_top->size() < cfg_.window_size) {
    spdlog::trace("Trying to get more lines after a refresh from the top did not give enough lines");
    LinesResult extra = load_from_bottom(next.starts.first(), cfg_.window_size - from_top->size(),
                                         LoadMode::Move, next);
    if (extra) from_top->insert(from_top->begin(), extra->begin(), extra->end());
  }
  state_ = std::move(next);
  return from_top;
}

LinesResult WindowedLineReader::load_from_top(std::uint64_t offset, size_t lines, LoadMode mode,
                                              WindowState& state) {
  std::string msg;
  std::unique_ptr<IByteSource> src = open_source_(cfg_.file, msg);
  if (!src) return unavailable(msg);

  spdlog::trace("Loading {} lines from the top, file: {}", lines, cfg_.file.string());
  try {
    LineScanner scanner(*src, cfg_.chunk_size);
    WindowState scratch = state;
    if (mode == LoadMode::Refresh) {
      scratch = WindowState(cfg_.window_size);
      if (!scanner.resolve_line_start(offset, offset, msg)) return unavailable(msg);
    }
    if (scratch.starts.empty()) scratch.starts.push_back(offset);

    std::vector<std::string> result;
    if (offset >= src->size()) {
      spdlog::trace("Already at the end of the file, nothing to return");
    } else if (!scanner.scan_down(offset, lines, scratch, result, msg)) {
      return unavailable(msg);
    }
    spdlog::debug("Loaded {} lines from file {}", result.size(), cfg_.file.string());
    spdlog::trace("Line starts: {}", scratch.starts.to_string());
    state = std::move(scratch);
    return result;
  } catch (const std::exception& e) {
    return unavailable(e.what());
  }
}

LinesResult WindowedLineReader::load_from_bottom(std::uint64_t boundary, size_t lines, LoadMode mode,
                                                 WindowState& state) {
  std::string msg;
  std::unique_ptr<IByteSource> src = open_source_(cfg_.file, msg);
  if (!src) return unavailable(msg);

  spdlog::trace("Loading {} lines from the bottom, file: {}", lines, cfg_.file.string());
  if (boundary == 0) {
    spdlog::trace("Already at the start of the file, nothing to return");
    if (mode == LoadMode::Refresh) {
      state = WindowState(cfg_.window_size);
      state.starts.push_back(0);
    }
    return std::vector<std::string>();
  }
  try {
    LineScanner scanner(*src, cfg_.chunk_size);
    WindowState scratch = state;
    if (mode == LoadMode::Refresh) {
      scratch = WindowState(cfg_.window_size);
      if (!scanner.resolve_line_start(boundary, boundary, msg)) return unavailable(msg);
    }
    if (scratch.starts.empty()) scratch.starts.push_back(boundary);

    std::vector<std::string> result;
    if (!scanner.scan_up(boundary, lines, scratch, result, msg)) return unavailable(msg);
    spdlog::debug("Loaded {} lines from file {}", result.size(), cfg_.file.string());
    spdlog::trace("Line starts: {}", scratch.starts.to_string());
    state = std::move(scratch);
    return result;
  } catch (const std::exception& e) {
    return unavailable(e.what());
  }
}

LinesResult WindowedLineReader::unavailable(const std::string& msg) {
  last_error_ = msg;
  spdlog::warn("Error reading file [{}]: {}", cfg_.file.string(), msg);
  return std::nullopt;
}
