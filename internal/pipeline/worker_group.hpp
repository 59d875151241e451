#pragma once

#include <exception>
#include <thread>
#include <utility>
#include <vector>

#include "internal/pipeline/partition_planner.hpp"
#include "internal/pipeline/worker_result.hpp"

namespace pageforge::pipeline {

/*
  Runs fn(range) on its own thread for every range and joins all of them.

  Does not return until every spawned thread has terminated. Each thread
  writes only its own slot of the result vector. An exception escaping fn is
  recorded as a failure on the range's first page.
*/
template <typename Fn>
std::vector<WorkerResult> RunWorkers(const std::vector<PageRange>& ranges, Fn&& fn) {
  std::vector<WorkerResult> results(ranges.size());
  std::vector<std::thread>  threads;
  threads.reserve(ranges.size());

  auto join_all = [&threads] {
    for (auto& thread : threads) {
      if (thread.joinable()) thread.join();
    }
  };

  try {
    for (std::size_t i = 0; i < ranges.size(); ++i) {
      threads.emplace_back([&results, &ranges, &fn, i] {
        results[i].range = ranges[i];
        try {
          results[i] = fn(ranges[i]);
        } catch (const std::exception& e) {
          results[i].failure = WorkerFailure{ranges[i].first, std::nullopt, e.what()};
        }
      });
    }
  } catch (...) {
    // thread creation failed; the already running workers still reference results
    join_all();
    throw;
  }

  join_all();
  return results;
}

} // namespace pageforge::pipeline
