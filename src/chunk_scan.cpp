#include "chunk_scan.hpp"

ForwardStep scan_forward_chunk(std::string_view chunk, std::uint64_t chunk_offset,
                               std::uint64_t file_size, size_t wanted, std::string carry) {
  ForwardStep step;
  if (wanted == 0) { step.carry = std::move(carry); step.done = true; return step; }
  const std::uint64_t last_index = file_size > 0 ? file_size - 1 : 0;
  size_t line_start = 0;
  for (size_t i = 0; i < chunk.size(); ++i) {
    bool is_delim = (chunk[i] == kLineDelimiter);
    bool is_last_byte = (chunk_offset + i == last_index);
    if (!is_delim && !is_last_byte) continue;

    // the delimiter itself is not part of the line
    size_t line_end = is_delim ? i : i + 1;
    std::string line = std::move(carry);
    carry = std::string();
    line.append(chunk.data() + line_start, line_end - line_start);
    step.lines.push_back(std::move(line));
    step.ends.push_back(chunk_offset + i + 1);
    line_start = i + 1;

    if (is_last_byte || step.lines.size() >= wanted) {
      step.done = true;
      return step;
    }
  }
  carry.append(chunk.data() + line_start, chunk.size() - line_start);
  step.carry = std::move(carry);
  return step;
}

BackwardStep scan_backward_chunk(std::string_view chunk, std::uint64_t chunk_offset,
                                 size_t wanted, std::string carry) {
  BackwardStep step;
  if (wanted == 0) { step.carry = std::move(carry); step.done = true; return step; }
  size_t line_end = chunk.size();
  for (size_t i = chunk.size(); i-- > 0;) {
    if (chunk[i] != kLineDelimiter) continue;
    std::string line(chunk.substr(i + 1, line_end - i - 1));
    line += carry;
    carry.clear();
    step.lines.push_back(std::move(line));
    step.starts.push_back(chunk_offset + i + 1);
    line_end = i;
    if (step.lines.size() >= wanted) {
      step.done = true;
      return step;
    }
  }
  std::string rest(chunk.substr(0, line_end));
  rest += carry;
  if (chunk_offset == 0) {
    // file start: whatever is left is the first line of the file
    step.lines.push_back(std::move(rest));
    step.starts.push_back(0);
    step.done = true;
    return step;
  }
  step.carry = std::move(rest);
  return step;
}
