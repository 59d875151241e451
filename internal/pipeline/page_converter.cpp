#include "page_converter.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::pipeline {

using observability::IntField;
using observability::StringField;

void RequireNonEmptyFile(const std::filesystem::path& path) {
  std::error_code ec;
  const auto      status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    throw util::IOFailure("missing image file " + path.string());
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw util::IOFailure("cannot stat " + path.string() + ": " + ec.message());
  }
  if (size == 0) {
    throw util::IOFailure("empty image file " + path.string());
  }
}

PageConverter::PageConverter(raster::RasterBackendPtr backend, SmallVariantSource small_source)
    : backend_(std::move(backend)), small_source_(small_source) {
}

void PageConverter::ConvertPage(const ConversionJob& job, int page) const {
  const std::filesystem::path large  = ResolvePage(job.local_templates.large, page);
  const std::filesystem::path normal = ResolvePage(job.local_templates.normal, page);
  const std::filesystem::path small  = ResolvePage(job.local_templates.small, page);

  backend_->RasterizePage(job.source_path, PageRange{page, page}, large);
  RequireNonEmptyFile(large);

  const int normal_edge = MaxDimension(ImageVariant::kNormal);
  backend_->Resize(large, normal_edge, normal_edge, normal);
  RequireNonEmptyFile(normal);

  const int small_edge = MaxDimension(ImageVariant::kSmall);
  backend_->Resize(small_source_ == SmallVariantSource::kNormal ? normal : large, small_edge, small_edge, small);
  RequireNonEmptyFile(small);
}

WorkerResult PageConverter::ConvertRange(const ConversionJob& job, const PageRange& range) const {
  WorkerResult result;
  result.range = range;

  for (int page = range.first; page <= range.last; ++page) {
    try {
      ConvertPage(job, page);
    } catch (const std::exception& e) {
      PAGEFORGE_LOG_ERROR("Page conversion failed, abandoning range",
                          {StringField("range", ToString(range)), IntField("page", page), StringField("error", e.what())});
      result.failure = WorkerFailure{page, std::nullopt, e.what()};
      return result;
    }
    ++result.completed;
  }
  return result;
}

} // namespace pageforge::pipeline
