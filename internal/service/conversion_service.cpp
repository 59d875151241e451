#include "conversion_service.hpp"

#include <arrow/io/file.h>

#include <chrono>
#include <cstdint>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/conversion_coordinator.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/scratch_space.hpp"

namespace pageforge::service {

using namespace pageforge::convert::v1;
using observability::DurationMsField;
using observability::IntField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    PAGEFORGE_LOG_INFO("RPC finished", {StringField("route", route), DurationMsField("elapsed", elapsed_ms())});
    return result;
  } catch (const std::exception& ex) {
    PAGEFORGE_LOG_ERROR("RPC failed",
                        {StringField("route", route), StringField("error", ex.what()), DurationMsField("elapsed", elapsed_ms())});
    throw;
  }
}

void AppendFailures(const pipeline::PhaseReport& report, Phase phase, ConvertResponse* resp) {
  for (const auto& worker : report.workers) {
    if (worker.ok()) continue;

    auto* failure = resp->add_failures();
    failure->set_phase(phase);
    failure->set_first_page(static_cast<uint32_t>(worker.range.first));
    failure->set_last_page(static_cast<uint32_t>(worker.range.last));
    failure->set_failed_page(static_cast<uint32_t>(worker.failure->page));
    if (worker.failure->variant) {
      failure->set_variant(std::string(pipeline::VariantName(*worker.failure->variant)));
    }
    failure->set_error(worker.failure->message);
    failure->set_completed(static_cast<uint32_t>(worker.completed));
  }
}

} // namespace

pipeline::FormValues ToFormValues(const ConvertRequest& req) {
  pipeline::FormValues form;
  for (const auto& field : req.fields()) {
    form[field.name()].push_back(field.value());
  }
  return form;
}

ConversionService::ConversionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void ConversionService::FetchSource(const std::string& remote_path, const std::filesystem::path& local_path) const {
  using storage::common::Unwrap;

  PAGEFORGE_LOG_INFO("Fetching source document", {StringField("remote_path", remote_path), StringField("local_path", local_path.string())});

  auto data = ctx_.store->Fetch(remote_path);
  auto out  = Unwrap<util::IOFailure>(arrow::io::FileOutputStream::Open(local_path.string()));
  Unwrap<util::IOFailure>(out->Write(data));
  Unwrap<util::IOFailure>(out->Close());
}

ConvertResponse ConversionService::Convert(const ConvertRequest& req) {
  return ObserveRpc("ConversionService.Convert", [&] {
    const auto form = ToFormValues(req);

    // all caller input is checked before any store or disk work
    const auto& source = pipeline::RequireSingleValue(form, kSourceField);
    storage::common::ValidateObjectKey(source);
    const auto remote_templates = pipeline::UploadCoordinator::ParseTemplates(form);

    util::ScratchDirectory scratch(ctx_.scratch_root);
    const auto             source_path = scratch.Path() / "source.pdf";
    FetchSource(source, source_path);

    const auto local_templates = pipeline::VariantTemplates::FromBase((scratch.Path() / "page%d.jpg").string());
    const auto conversion      = ctx_.conversion->Convert(source_path, local_templates);
    const auto upload          = ctx_.upload->UploadAll(conversion.job, remote_templates);

    ConvertResponse resp;
    resp.set_page_count(static_cast<uint32_t>(conversion.job.page_count));
    resp.set_converted_pages(static_cast<uint32_t>(conversion.phase.Completed()));
    resp.set_uploaded_objects(static_cast<uint32_t>(upload.Completed()));
    AppendFailures(conversion.phase, PHASE_CONVERSION, &resp);
    AppendFailures(upload, PHASE_UPLOAD, &resp);
    resp.set_complete(resp.failures_size() == 0 && upload.Completed() == std::int64_t{3} * conversion.job.page_count);

    if (!resp.complete()) {
      PAGEFORGE_LOG_WARN("Conversion request partially failed",
                         {StringField("source", source), IntField("pages", conversion.job.page_count),
                          IntField("uploaded", upload.Completed()), IntField("failed_workers", resp.failures_size())});
    }
    return resp;
  });
}

} // namespace pageforge::service
