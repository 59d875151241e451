#include "internal/pipeline/partition_planner.hpp"

#include <cassert>
#include <climits>
#include <iostream>
#include <vector>

namespace {

using pageforge::pipeline::PageRange;
using pageforge::pipeline::PlanPartitions;

void TestZeroPagesYieldsNoRanges() {
  for (int workers = 1; workers <= 12; ++workers) {
    assert(PlanPartitions(0, workers).empty());
  }
}

void TestSixPagesTwoWorkers() {
  const auto ranges = PlanPartitions(6, 2);
  assert(ranges.size() == 2);
  assert((ranges[0] == PageRange{1, 3}));
  assert((ranges[1] == PageRange{4, 6}));
}

void TestSixPagesTenWorkersGivesSingletons() {
  const auto ranges = PlanPartitions(6, 10);
  assert(ranges.size() == 6);
  for (int i = 0; i < 6; ++i) {
    assert((ranges[static_cast<std::size_t>(i)] == PageRange{i + 1, i + 1}));
  }
}

void TestUnevenSplitShortensLastRange() {
  const auto ranges = PlanPartitions(10, 3);
  assert(ranges.size() == 3);
  assert((ranges[0] == PageRange{1, 4}));
  assert((ranges[1] == PageRange{5, 8}));
  assert((ranges[2] == PageRange{9, 10}));
}

// ceil-division can leave workers idle: 7 pages over 6 workers is 4 ranges of 2,2,2,1
void TestFewerRangesThanWorkers() {
  const auto ranges = PlanPartitions(7, 6);
  assert(ranges.size() == 4);
  assert((ranges.back() == PageRange{7, 7}));
}

void TestLargestPageCountDoesNotOverflow() {
  const auto single = PlanPartitions(INT_MAX, 1);
  assert(single.size() == 1);
  assert((single[0] == PageRange{1, INT_MAX}));

  const auto halves = PlanPartitions(INT_MAX, 2);
  assert(halves.size() == 2);
  assert((halves[0] == PageRange{1, 1073741824}));
  assert((halves[1] == PageRange{1073741825, INT_MAX}));

  const auto many = PlanPartitions(INT_MAX, 256);
  assert(many.size() == 256);
  assert(many.back().last == INT_MAX);
}

void TestCoverageProperties() {
  for (int total = 1; total <= 60; ++total) {
    for (int workers = 1; workers <= 16; ++workers) {
      const auto ranges     = PlanPartitions(total, workers);
      const int  per_worker = (total + workers - 1) / workers;

      assert(!ranges.empty());
      assert(static_cast<int>(ranges.size()) <= workers);
      assert(ranges.front().first == 1);
      assert(ranges.back().last == total);

      for (std::size_t i = 0; i < ranges.size(); ++i) {
        assert(ranges[i].first <= ranges[i].last);
        if (i > 0) {
          // sorted, contiguous, no overlap
          assert(ranges[i].first == ranges[i - 1].last + 1);
        }
        if (i + 1 < ranges.size()) {
          assert(ranges[i].Size() == per_worker);
        } else {
          const int remainder = total % per_worker;
          assert(ranges[i].Size() == (remainder == 0 ? per_worker : remainder));
        }
      }
    }
  }
}

} // namespace

int main() {
  TestZeroPagesYieldsNoRanges();
  TestSixPagesTwoWorkers();
  TestSixPagesTenWorkersGivesSingletons();
  TestUnevenSplitShortensLastRange();
  TestFewerRangesThanWorkers();
  TestLargestPageCountDoesNotOverflow();
  TestCoverageProperties();

  std::cout << "pageforge_unit_partition_planner: pass\n";
  return 0;
}
