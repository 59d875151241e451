#pragma once

#include <filesystem>

#include "internal/pipeline/conversion_job.hpp"
#include "internal/pipeline/page_converter.hpp"
#include "internal/pipeline/page_counter.hpp"
#include "internal/pipeline/worker_result.hpp"
#include "internal/raster/raster_backend.hpp"

namespace pageforge::pipeline {

struct ConversionOptions {
  int                workers      = 2;
  SmallVariantSource small_source = SmallVariantSource::kNormal;
};

struct ConversionReport {
  ConversionJob job;
  PhaseReport   phase;
};

/*
  Counts the document's pages, splits them across the conversion workers and
  blocks until every worker has returned.
*/
class ConversionCoordinator {
 public:
  ConversionCoordinator(raster::RasterBackendPtr backend, ConversionOptions options);

  // throws util::IOFailure when the page count cannot be determined
  ConversionReport Convert(const std::filesystem::path& source, const VariantTemplates& local_templates) const;

  const ConversionOptions& Options() const {
    return options_;
  }

 private:
  PageCounter       counter_;
  PageConverter     converter_;
  ConversionOptions options_;
};

} // namespace pageforge::pipeline
