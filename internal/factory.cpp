#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/grpc/conversion_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/conversion_coordinator.hpp"
#include "internal/pipeline/upload_coordinator.hpp"
#include "internal/raster/ghostscript_backend.hpp"
#include "internal/service/conversion_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object/arrow_object_store.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::factory {

using namespace pageforge;
using pageforge::runtime::config::RuntimeConfig;

namespace {

storage::ObjectStorePtr BuildObjectStore(const RuntimeConfig& config) {
  const auto& object_store = config.object_store();
  if (object_store.root_path().empty()) {
    throw util::ValidationFailure("object_store.root_path is required");
  }

  auto [fs, root] = storage::common::Unwrap(storage::common::ResolveFileSystem(object_store));
  PAGEFORGE_LOG_INFO("Object store ready", {observability::StringField("filesystem", fs->type_name()), observability::StringField("root", root)});
  return std::make_shared<storage::ArrowObjectStore>(std::move(fs), std::move(root));
}

raster::RasterBackendPtr BuildRasterBackend(const RuntimeConfig& config) {
  const auto& conversion = config.conversion();

  raster::GhostscriptOptions options;
  options.rasterizer_binary = conversion.rasterizer_binary();
  options.resizer_binary    = conversion.resizer_binary();
  options.resolution_dpi    = static_cast<int>(conversion.resolution_dpi());
  options.jpeg_quality      = static_cast<int>(conversion.jpeg_quality());
  return std::make_shared<raster::GhostscriptBackend>(std::move(options));
}

pipeline::ConversionOptions ToConversionOptions(const RuntimeConfig& config) {
  pipeline::ConversionOptions options;
  options.workers      = static_cast<int>(config.conversion().workers());
  options.small_source = config.conversion().small_source() == pageforge::runtime::config::SMALL_VARIANT_SOURCE_LARGE
                             ? pipeline::SmallVariantSource::kLarge
                             : pipeline::SmallVariantSource::kNormal;
  return options;
}

pipeline::UploadOptions ToUploadOptions(const RuntimeConfig& config) {
  pipeline::UploadOptions options;
  options.workers                 = static_cast<int>(config.upload().workers());
  options.attributes.content_type = config.upload().content_type();
  options.attributes.visibility   = config.upload().public_read() ? storage::Visibility::kPublicRead : storage::Visibility::kPrivate;
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto store   = BuildObjectStore(config);
  auto backend = BuildRasterBackend(config);

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store        = store;
  ctx.conversion   = std::make_shared<pipeline::ConversionCoordinator>(backend, ToConversionOptions(config));
  ctx.upload       = std::make_shared<pipeline::UploadCoordinator>(store, ToUploadOptions(config));
  ctx.scratch_root = config.conversion().scratch_root();

  PAGEFORGE_LOG_INFO("Pipeline configured", {observability::IntField("conversion_workers", config.conversion().workers()),
                                             observability::IntField("upload_workers", config.upload().workers()),
                                             observability::IntField("dpi", config.conversion().resolution_dpi()),
                                             observability::StringField("scratch_root", config.conversion().scratch_root())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.conversion_service = std::make_shared<service::ConversionService>(std::move(ctx));
  app.grpc_services.push_back(std::make_unique<grpc::ConversionServer>(app.conversion_service));

  return app;
}

} // namespace pageforge::factory
