#include "conversion_coordinator.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/partition_planner.hpp"
#include "internal/pipeline/worker_group.hpp"

namespace pageforge::pipeline {

using observability::DurationMsField;
using observability::IntField;
using observability::StringField;

ConversionCoordinator::ConversionCoordinator(raster::RasterBackendPtr backend, ConversionOptions options)
    : counter_(backend), converter_(backend, options.small_source), options_(options) {
}

ConversionReport ConversionCoordinator::Convert(const std::filesystem::path& source, const VariantTemplates& local_templates) const {
  const auto started_at = std::chrono::steady_clock::now();

  ConversionReport report;
  report.job.source_path     = source;
  report.job.local_templates = local_templates;
  report.job.page_count      = counter_.CountPages(source);
  report.phase.phase         = "conversion";

  const auto  ranges = PlanPartitions(report.job.page_count, options_.workers);
  const auto& job    = report.job;

  PAGEFORGE_LOG_INFO("Converting pages", {StringField("document", source.string()), IntField("pages", job.page_count),
                                          IntField("workers", static_cast<std::int64_t>(ranges.size()))});

  report.phase.workers = RunWorkers(ranges, [this, &job](const PageRange& range) { return converter_.ConvertRange(job, range); });

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  if (report.phase.ok()) {
    PAGEFORGE_LOG_INFO("Conversion finished", {IntField("pages", report.phase.Completed()), DurationMsField("elapsed", elapsed_ms)});
  } else {
    PAGEFORGE_LOG_WARN("Conversion finished with failed workers",
                       {IntField("converted", report.phase.Completed()), IntField("pages", job.page_count),
                        IntField("failed_workers", report.phase.FailedWorkers()), DurationMsField("elapsed", elapsed_ms)});
  }
  return report;
}

} // namespace pageforge::pipeline
