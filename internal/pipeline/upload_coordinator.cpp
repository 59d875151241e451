#include "upload_coordinator.hpp"

#include <chrono>
#include <cstdint>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/partition_planner.hpp"
#include "internal/pipeline/path_template.hpp"
#include "internal/pipeline/worker_group.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::pipeline {

using observability::DurationMsField;
using observability::IntField;
using observability::StringField;

const std::string& RequireSingleValue(const FormValues& form, const std::string& name) {
  const auto it = form.find(name);
  if (it == form.end() || it->second.empty()) {
    throw util::ValidationFailure("must specify '" + name + "'");
  }
  if (it->second.size() != 1) {
    throw util::ValidationFailure("must specify exactly one value for '" + name + "', got " + std::to_string(it->second.size()));
  }
  return it->second.front();
}

UploadCoordinator::UploadCoordinator(storage::ObjectStorePtr store, UploadOptions options)
    : uploader_(std::move(store), options.attributes), options_(std::move(options)) {
}

VariantTemplates UploadCoordinator::ParseTemplates(const FormValues& form) {
  VariantTemplates templates;
  templates.normal = RequireSingleValue(form, kNormalPathField);
  templates.small  = RequireSingleValue(form, kSmallPathField);
  templates.large  = RequireSingleValue(form, kLargePathField);

  RequireSinglePlaceholder(templates.normal, kNormalPathField);
  RequireSinglePlaceholder(templates.small, kSmallPathField);
  RequireSinglePlaceholder(templates.large, kLargePathField);

  storage::common::ValidateObjectKey(templates.normal);
  storage::common::ValidateObjectKey(templates.small);
  storage::common::ValidateObjectKey(templates.large);
  return templates;
}

std::vector<UploadTarget> UploadCoordinator::TargetsFor(const ConversionJob& job, const VariantTemplates& remote_templates,
                                                        const PageRange& range) {
  std::vector<UploadTarget> targets;
  targets.reserve(static_cast<std::size_t>(range.Size()) * kUploadOrder.size());
  for (int page = range.first; page <= range.last; ++page) {
    for (auto variant : kUploadOrder) {
      targets.push_back(MakeUploadTarget(job, remote_templates, page, variant));
    }
  }
  return targets;
}

PhaseReport UploadCoordinator::UploadAll(const ConversionJob& job, const FormValues& form) const {
  return UploadAll(job, ParseTemplates(form));
}

PhaseReport UploadCoordinator::UploadAll(const ConversionJob& job, const VariantTemplates& remote_templates) const {
  const auto started_at = std::chrono::steady_clock::now();

  PhaseReport report;
  report.phase = "upload";

  const auto ranges = PlanPartitions(job.page_count, options_.workers);
  PAGEFORGE_LOG_INFO("Uploading page images", {IntField("pages", job.page_count), IntField("objects", std::int64_t{3} * job.page_count),
                                               IntField("workers", static_cast<std::int64_t>(ranges.size()))});

  report.workers = RunWorkers(ranges, [this, &job, &remote_templates](const PageRange& range) {
    return UploadRange(job, remote_templates, range);
  });

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  if (report.ok()) {
    PAGEFORGE_LOG_INFO("Upload finished", {IntField("objects", report.Completed()), DurationMsField("elapsed", elapsed_ms)});
  } else {
    PAGEFORGE_LOG_WARN("Upload finished with failed workers",
                       {IntField("uploaded", report.Completed()), IntField("objects", std::int64_t{3} * job.page_count),
                        IntField("failed_workers", report.FailedWorkers()), DurationMsField("elapsed", elapsed_ms)});
  }
  return report;
}

WorkerResult UploadCoordinator::UploadRange(const ConversionJob& job, const VariantTemplates& remote_templates,
                                            const PageRange& range) const {
  WorkerResult result;
  result.range = range;

  for (const auto& target : TargetsFor(job, remote_templates, range)) {
    try {
      uploader_.Upload(target);
    } catch (const std::exception& e) {
      PAGEFORGE_LOG_ERROR("Page upload failed, abandoning range",
                          {StringField("range", ToString(range)), IntField("page", target.page_number),
                           StringField("variant", VariantName(target.variant)), StringField("remote_path", target.remote_path),
                           StringField("error", e.what())});
      result.failure = WorkerFailure{target.page_number, target.variant, e.what()};
      return result;
    }
    ++result.completed;
  }
  return result;
}

} // namespace pageforge::pipeline
