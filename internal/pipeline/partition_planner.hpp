#pragma once

#include <string>
#include <vector>

namespace pageforge::pipeline {

/*
  Contiguous, inclusive span of page numbers handled by one worker.
*/
struct PageRange {
  int first = 1;
  int last  = 1;

  int Size() const {
    return last - first + 1;
  }

  bool operator==(const PageRange& other) const {
    return first == other.first && last == other.last;
  }
  bool operator!=(const PageRange& other) const {
    return !(*this == other);
  }
};

std::string ToString(const PageRange& range);

/*
  Splits [1, total] into at most worker_count ranges of ceil(total / worker_count)
  pages each. The last range is clamped to total and may be shorter.
  total == 0 yields no ranges. worker_count must be >= 1.
*/
std::vector<PageRange> PlanPartitions(int total, int worker_count);

} // namespace pageforge::pipeline
