#pragma once
/*
 * LineStartIndex
 *
 * Purpose: ordered byte offsets bounding the lines of the current window.
 *          N lines are delimited by N + 1 offsets: first() is the start of the first
 *          line, last() is the offset just after the last line.
 * Constraint: capacity is bookkeeping only; the index never evicts by itself, callers
 *             pop from the opposite end before pushing into a full index.
 */
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

class LineStartIndex {
public:
  explicit LineStartIndex(size_t capacity) : capacity_(capacity) {}

  void push_front(std::uint64_t offset) { starts_.push_front(offset); }
  void push_back(std::uint64_t offset) { starts_.push_back(offset); }
  void pop_front() { starts_.pop_front(); }
  void pop_back() { starts_.pop_back(); }
  void clear() { starts_.clear(); }

  // 0 when empty, so an unloaded reader scans from the start of the file.
  std::uint64_t first() const { return starts_.empty() ? 0 : starts_.front(); }
  std::uint64_t last() const { return starts_.empty() ? 0 : starts_.back(); }

  size_t size() const { return starts_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return starts_.empty(); }
  bool full() const { return starts_.size() >= capacity_; }
  std::uint64_t operator[](size_t i) const { return starts_[i]; }

  std::deque<std::uint64_t>::const_iterator begin() const { return starts_.begin(); }
  std::deque<std::uint64_t>::const_iterator end() const { return starts_.end(); }

  // Offsets strictly increasing.
  bool is_ordered() const;
  std::string to_string() const;

private:
  size_t capacity_;
  std::deque<std::uint64_t> starts_;
};
