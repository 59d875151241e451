#include "internal/service/conversion_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/pipeline/conversion_coordinator.hpp"
#include "internal/pipeline/upload_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "test_fakes.hpp"

namespace {

using namespace pageforge::convert::v1;
using pageforge::pipeline::ConversionCoordinator;
using pageforge::pipeline::ConversionOptions;
using pageforge::pipeline::SmallVariantSource;
using pageforge::pipeline::UploadCoordinator;
using pageforge::pipeline::UploadOptions;
using pageforge::service::ConversionService;
using pageforge::service::ServiceContext;
using pageforge::testing::FakeRasterBackend;
using pageforge::testing::MakeTempDir;
using pageforge::testing::RecordingObjectStore;

struct Harness {
  std::filesystem::path                 scratch_root;
  std::shared_ptr<FakeRasterBackend>    backend;
  std::shared_ptr<RecordingObjectStore> store;
  std::shared_ptr<ConversionService>    service;
};

Harness MakeHarness(const std::string& name, int page_count) {
  Harness h;
  h.scratch_root = MakeTempDir(name);
  h.backend      = std::make_shared<FakeRasterBackend>(page_count);
  h.store        = std::make_shared<RecordingObjectStore>();
  h.store->Put("incoming/doc.pdf", "%PDF-1.4 fake");

  ServiceContext ctx;
  ctx.store        = h.store;
  ctx.conversion   = std::make_shared<ConversionCoordinator>(h.backend, ConversionOptions{2, SmallVariantSource::kNormal});
  ctx.upload       = std::make_shared<UploadCoordinator>(h.store, UploadOptions{});
  ctx.scratch_root = h.scratch_root;
  h.service        = std::make_shared<ConversionService>(ctx);
  return h;
}

void AddField(ConvertRequest& req, const std::string& name, const std::string& value) {
  auto* field = req.add_fields();
  field->set_name(name);
  field->set_value(value);
}

ConvertRequest FullRequest() {
  ConvertRequest req;
  AddField(req, "pdf", "incoming/doc.pdf");
  AddField(req, "normal_path", "out/prefix%d.jpg");
  AddField(req, "small_path", "out/prefix%d-small.jpg");
  AddField(req, "large_path", "out/prefix%d-large.jpg");
  return req;
}

bool IsEmptyDirectory(const std::filesystem::path& dir) {
  return std::filesystem::is_directory(dir) && std::filesystem::directory_iterator(dir) == std::filesystem::directory_iterator();
}

void TestConvertsAndPublishesEveryPage() {
  auto h = MakeHarness("service_full", 6);

  const auto resp = h.service->Convert(FullRequest());

  assert(resp.page_count() == 6);
  assert(resp.converted_pages() == 6);
  assert(resp.uploaded_objects() == 18);
  assert(resp.failures_size() == 0);
  assert(resp.complete());

  assert(h.backend->CountedDocument() == "%PDF-1.4 fake");
  assert(h.store->fetch_calls == 1);

  // 18 page objects plus the source document
  const auto objects = h.store->Objects();
  assert(objects.size() == 19);
  assert(objects.at("out/prefix1.jpg").data == "large-page-1@800");
  assert(objects.at("out/prefix4-small.jpg").data == "large-page-4@800@300");
  assert(objects.at("out/prefix6-large.jpg").data == "large-page-6");

  // per-request scratch space is gone once the request returns
  assert(IsEmptyDirectory(h.scratch_root));
  std::filesystem::remove_all(h.scratch_root);
}

void TestMissingSourceFieldFailsBeforeFetch() {
  auto h   = MakeHarness("service_missing_pdf", 3);
  auto req = FullRequest();
  req.mutable_fields()->DeleteSubrange(0, 1);

  bool threw = false;
  try {
    (void)h.service->Convert(req);
  } catch (const pageforge::util::ValidationFailure&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->fetch_calls == 0);
  assert(h.store->store_calls == 0);
  assert(h.backend->Rasterized().empty());
  std::filesystem::remove_all(h.scratch_root);
}

void TestInvalidTemplateFailsBeforeFetch() {
  auto h   = MakeHarness("service_bad_template", 3);
  auto req = FullRequest();
  AddField(req, "small_path", "again%d.jpg");

  bool threw = false;
  try {
    (void)h.service->Convert(req);
  } catch (const pageforge::util::ValidationFailure& e) {
    threw = std::string(e.what()).find("small_path") != std::string::npos;
  }
  assert(threw);
  assert(h.store->fetch_calls == 0);
  std::filesystem::remove_all(h.scratch_root);
}

void TestMissingSourceObjectIsRemoteFailure() {
  auto h   = MakeHarness("service_no_object", 3);
  auto req = FullRequest();
  req.mutable_fields(0)->set_value("incoming/absent.pdf");

  bool threw = false;
  try {
    (void)h.service->Convert(req);
  } catch (const pageforge::util::RemoteFailure&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->store_calls == 0);
  assert(IsEmptyDirectory(h.scratch_root));
  std::filesystem::remove_all(h.scratch_root);
}

void TestPartialFailureIsReported() {
  auto h = MakeHarness("service_partial", 6);
  h.backend->failing_pages = {5};

  const auto resp = h.service->Convert(FullRequest());

  assert(!resp.complete());
  assert(resp.page_count() == 6);
  assert(resp.converted_pages() == 4);
  assert(resp.failures_size() >= 1);

  const auto& conversion_failure = resp.failures(0);
  assert(conversion_failure.phase() == PHASE_CONVERSION);
  assert(conversion_failure.first_page() == 4);
  assert(conversion_failure.last_page() == 6);
  assert(conversion_failure.failed_page() == 5);
  assert(conversion_failure.completed() == 1);

  // uploads still run for everything that was converted
  const auto objects = h.store->Objects();
  assert(objects.count("out/prefix3-large.jpg") == 1);
  assert(objects.count("out/prefix4-large.jpg") == 1);
  assert(objects.count("out/prefix5.jpg") == 0);
  for (int i = 1; i < resp.failures_size(); ++i) {
    assert(resp.failures(i).phase() == PHASE_UPLOAD);
  }
  std::filesystem::remove_all(h.scratch_root);
}

void TestCountFailureFailsRequest() {
  auto h = MakeHarness("service_count", 6);
  h.backend->count_fails = true;

  bool threw = false;
  try {
    (void)h.service->Convert(FullRequest());
  } catch (const pageforge::util::IOFailure&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->store_calls == 0);
  std::filesystem::remove_all(h.scratch_root);
}

} // namespace

int main() {
  TestConvertsAndPublishesEveryPage();
  TestMissingSourceFieldFailsBeforeFetch();
  TestInvalidTemplateFailsBeforeFetch();
  TestMissingSourceObjectIsRemoteFailure();
  TestPartialFailureIsReported();
  TestCountFailureFailsRequest();

  std::cout << "pageforge_unit_conversion_service: pass\n";
  return 0;
}
