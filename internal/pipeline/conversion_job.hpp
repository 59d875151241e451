#pragma once

#include <filesystem>
#include <string>

#include "internal/pipeline/image_variant.hpp"
#include "internal/pipeline/path_template.hpp"

namespace pageforge::pipeline {

/*
  One document being converted.

  Built once after the page count is known and shared read-only by every
  worker of both phases.
*/
struct ConversionJob {
  std::filesystem::path source_path;

  // Local image templates; normal is the "jpeg" template the others derive from.
  VariantTemplates local_templates;

  int page_count = 0;
};

/*
  One page image and the object key it is published under.
*/
struct UploadTarget {
  int          page_number = 0;
  ImageVariant variant     = ImageVariant::kNormal;
  std::string  local_path;
  std::string  remote_path;
};

inline UploadTarget MakeUploadTarget(const ConversionJob& job, const VariantTemplates& remote, int page, ImageVariant variant) {
  UploadTarget target;
  target.page_number = page;
  target.variant     = variant;
  target.local_path  = ResolvePage(job.local_templates.For(variant), page);
  target.remote_path = ResolvePage(remote.For(variant), page);
  return target;
}

} // namespace pageforge::pipeline
