#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/pipeline/image_variant.hpp"
#include "internal/pipeline/partition_planner.hpp"

namespace pageforge::pipeline {

struct WorkerFailure {
  int                         page = 0;
  std::optional<ImageVariant> variant;
  std::string                 message;
};

/*
  Outcome of one worker over its assigned range.

  A worker stops at its first error; pages after failure->page were not
  attempted. completed counts finished units (pages for conversion, objects
  for upload).
*/
struct WorkerResult {
  PageRange                    range;
  int                          completed = 0;
  std::optional<WorkerFailure> failure;

  bool ok() const {
    return !failure.has_value();
  }
};

struct PhaseReport {
  std::string               phase;
  std::vector<WorkerResult> workers;

  bool ok() const {
    for (const auto& worker : workers) {
      if (!worker.ok()) return false;
    }
    return true;
  }

  int Completed() const {
    int total = 0;
    for (const auto& worker : workers) total += worker.completed;
    return total;
  }

  int FailedWorkers() const {
    int failed = 0;
    for (const auto& worker : workers) {
      if (!worker.ok()) ++failed;
    }
    return failed;
  }
};

} // namespace pageforge::pipeline
