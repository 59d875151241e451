#pragma once

#include <filesystem>

#include "internal/pipeline/conversion_job.hpp"
#include "internal/pipeline/worker_result.hpp"
#include "internal/raster/raster_backend.hpp"

namespace pageforge::pipeline {

enum class SmallVariantSource {
  kNormal,
  kLarge,
};

/*
  Produces the large, normal and small images for a page range.

    large  : raw rasterization of the page
    normal : large scaled into 800x800
    small  : normal (or large) scaled into 300x300

  Stops at the first failing page and reports it; later pages of the range
  are not attempted.
*/
class PageConverter {
 public:
  PageConverter(raster::RasterBackendPtr backend, SmallVariantSource small_source);

  WorkerResult ConvertRange(const ConversionJob& job, const PageRange& range) const;

  // Converts one page; throws util::IOFailure.
  void ConvertPage(const ConversionJob& job, int page) const;

 private:
  raster::RasterBackendPtr backend_;
  SmallVariantSource       small_source_;
};

// throws util::IOFailure unless path names a non-empty regular file
void RequireNonEmptyFile(const std::filesystem::path& path);

} // namespace pageforge::pipeline
