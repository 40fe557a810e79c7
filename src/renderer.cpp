#include "renderer.hpp"
#include <algorithm>
#include <sstream>

std::string printable_line(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c == '\t') {
      size_t pad = 8 - (out.size() % 8);
      out.append(pad, ' ');
    } else if (c < 32 || c == 127) {
      out.push_back('?');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

void Renderer::render(ITerminal& term, const PagerRenderInfo& info) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(0, rows - 1);
  int shown = 0;
  if (info.lines) {
    // the newest lines stay visible when the window is taller than the screen
    int n = static_cast<int>(info.lines->size());
    int first = info.follow ? std::max(0, n - max_text_rows) : 0;
    for (int i = first; i < n && shown < max_text_rows; ++i, ++shown) {
      std::string s = printable_line((*info.lines)[i]);
      int start_col = std::min(std::max(0, info.left_col), static_cast<int>(s.size()));
      std::string vis = s.substr(start_col, std::max(0, cols));
      term.draw_text(shown, 0, vis);
      term.clear_to_eol(shown, static_cast<int>(vis.size()));
    }
  }
  for (int i = shown; i < max_text_rows; ++i) term.draw_text(i, 0, "~");

  std::string status;
  if (info.command_mode) {
    status = ":" + info.cmdline;
  } else {
    std::ostringstream oss;
    oss << info.file_path.string()
        << "  lines:" << (info.lines ? info.lines->size() : 0)
        << "  bytes:" << info.first_offset << "-" << info.last_offset;
    if (info.left_col > 0) oss << "  col:" << (info.left_col + 1);
    if (info.follow) oss << "  [FOLLOW]";
    if (!info.message.empty()) oss << "  | " << info.message;
    status = oss.str();
  }
  if (rows > 0) term.draw_status(rows - 1, status);
  term.refresh();
}
