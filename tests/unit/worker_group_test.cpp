#include "internal/pipeline/worker_group.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/pipeline/partition_planner.hpp"

namespace {

using namespace pageforge::pipeline;

void TestResultsKeepRangeOrder() {
  const auto ranges  = PlanPartitions(10, 4);
  const auto results = RunWorkers(ranges, [](const PageRange& range) {
    WorkerResult result;
    result.range     = range;
    result.completed = range.Size();
    return result;
  });

  assert(results.size() == ranges.size());
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    assert(results[i].range == ranges[i]);
    assert(results[i].ok());
  }
}

void TestEscapingExceptionBecomesFailure() {
  const auto ranges  = PlanPartitions(6, 2);
  const auto results = RunWorkers(ranges, [](const PageRange& range) -> WorkerResult {
    if (range.first == 4) throw std::runtime_error("backend crashed");
    WorkerResult result;
    result.range     = range;
    result.completed = range.Size();
    return result;
  });

  assert(results.size() == 2);
  assert(results[0].ok());
  assert(results[0].completed == 3);

  const auto& failed = results[1];
  assert((failed.range == PageRange{4, 6}));
  assert(failed.completed == 0);
  assert(failed.failure->page == 4);
  assert(!failed.failure->variant.has_value());
  assert(failed.failure->message == "backend crashed");
}

void TestJoinsEveryWorkerBeforeReturning() {
  std::atomic<int> finished{0};
  const auto       ranges = PlanPartitions(8, 8);
  const auto       results = RunWorkers(ranges, [&finished](const PageRange& range) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5 * range.first));
    ++finished;
    WorkerResult result;
    result.range = range;
    return result;
  });

  assert(results.size() == 8);
  assert(finished == 8);
}

void TestNoRangesRunsNothing() {
  std::atomic<int> calls{0};
  const auto       results = RunWorkers(std::vector<PageRange>{}, [&calls](const PageRange&) {
    ++calls;
    return WorkerResult{};
  });
  assert(results.empty());
  assert(calls == 0);
}

} // namespace

int main() {
  TestResultsKeepRangeOrder();
  TestEscapingExceptionBecomesFailure();
  TestJoinsEveryWorkerBeforeReturning();
  TestNoRangesRunsNothing();

  std::cout << "pageforge_unit_worker_group: pass\n";
  return 0;
}
