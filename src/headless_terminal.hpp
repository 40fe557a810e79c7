#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal without a screen, for automated tests of the pager.
 * Feature: records what was drawn per row; replays a scripted key sequence and reports
 *          kNoKey (a poll timeout) once the script is exhausted.
 */
#include "iterminal.hpp"
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : size_{rows, cols}, rows_(rows) {}

  TermSize get_size() const override { return size_; }
  void clear() override { for (auto& r : rows_) r.clear(); }
  void draw_text(int row, int col, const std::string& text) override {
    if (row < 0 || row >= size_.rows || col < 0) return;
    std::string& r = rows_[row];
    if ((int)r.size() < col) r.resize(col, ' ');
    r.replace(col, std::string::npos, text.substr(0, std::max(0, size_.cols - col)));
  }
  void draw_status(int row, const std::string& text) override { draw_text(row, 0, text); }
  void clear_to_eol(int row, int col) override {
    if (row >= 0 && row < size_.rows && col >= 0 && (int)rows_[row].size() > col) rows_[row].resize(col);
  }
  void refresh() override { ++refreshes_; }
  int read_key(int) override {
    if (keys_.empty()) return kNoKey;
    int k = keys_.front();
    keys_.pop_front();
    return k;
  }

  void push_keys(const std::string& keys) { for (unsigned char c : keys) keys_.push_back(c); }
  void push_key(int key) { keys_.push_back(key); }
  const std::string& row(int r) const { return rows_[r]; }
  int refreshes() const { return refreshes_; }

private:
  TermSize size_;
  std::vector<std::string> rows_;
  std::deque<int> keys_;
  int refreshes_ = 0;
};
