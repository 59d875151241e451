#include "partition_planner.hpp"

#include <algorithm>
#include <cstdint>

namespace pageforge::pipeline {

std::string ToString(const PageRange& range) {
  return "[" + std::to_string(range.first) + "," + std::to_string(range.last) + "]";
}

std::vector<PageRange> PlanPartitions(int total, int worker_count) {
  std::vector<PageRange> ranges;
  if (total <= 0) {
    return ranges;
  }

  // 64-bit so first + per_worker cannot overflow near INT_MAX
  const std::int64_t last       = total;
  const std::int64_t per_worker = (last + worker_count - 1) / worker_count;
  ranges.reserve(static_cast<std::size_t>((last + per_worker - 1) / per_worker));

  for (std::int64_t first = 1; first <= last; first += per_worker) {
    ranges.push_back(PageRange{static_cast<int>(first), static_cast<int>(std::min(first + per_worker - 1, last))});
  }
  return ranges;
}

} // namespace pageforge::pipeline
