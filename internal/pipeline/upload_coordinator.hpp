#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/pipeline/conversion_job.hpp"
#include "internal/pipeline/page_uploader.hpp"
#include "internal/pipeline/worker_result.hpp"
#include "internal/storage/object_store.hpp"

namespace pageforge::pipeline {

// Request form values by field name. A name may carry several values.
using FormValues = std::unordered_map<std::string, std::vector<std::string>>;

inline constexpr const char* kNormalPathField = "normal_path";
inline constexpr const char* kSmallPathField  = "small_path";
inline constexpr const char* kLargePathField  = "large_path";

// throws util::ValidationFailure unless name has exactly one value
const std::string& RequireSingleValue(const FormValues& form, const std::string& name);

struct UploadOptions {
  int                       workers = 10;
  storage::ObjectAttributes attributes;
};

/*
  Publishes all 3 x page_count images of a converted job.

  Pages are split across the upload workers; each worker uploads normal,
  small and large for every page of its range and stops at its first error.
  Blocks until every worker has returned.
*/
class UploadCoordinator {
 public:
  UploadCoordinator(storage::ObjectStorePtr store, UploadOptions options);

  // Remote templates from the normal_path / small_path / large_path fields.
  // throws util::ValidationFailure for a missing or repeated field, or a
  // value without exactly one page placeholder
  static VariantTemplates ParseTemplates(const FormValues& form);

  // Validation happens before any store call.
  PhaseReport UploadAll(const ConversionJob& job, const FormValues& form) const;

  PhaseReport UploadAll(const ConversionJob& job, const VariantTemplates& remote_templates) const;

  // Targets of one worker range in upload order.
  static std::vector<UploadTarget> TargetsFor(const ConversionJob& job, const VariantTemplates& remote_templates, const PageRange& range);

 private:
  WorkerResult UploadRange(const ConversionJob& job, const VariantTemplates& remote_templates, const PageRange& range) const;

  PageUploader  uploader_;
  UploadOptions options_;
};

} // namespace pageforge::pipeline
