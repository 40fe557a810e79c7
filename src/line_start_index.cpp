#include "line_start_index.hpp"
#include <sstream>

bool LineStartIndex::is_ordered() const {
  for (size_t i = 1; i < starts_.size(); ++i) {
    if (starts_[i] <= starts_[i - 1]) return false;
  }
  return true;
}

std::string LineStartIndex::to_string() const {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < starts_.size(); ++i) {
    if (i) oss << ", ";
    oss << starts_[i];
  }
  oss << "] (" << starts_.size() << "/" << capacity_ << ")";
  return oss.str();
}
