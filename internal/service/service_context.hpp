#pragma once

#include <filesystem>
#include <memory>

namespace pageforge::pipeline {
class ConversionCoordinator;
class UploadCoordinator;
} // namespace pageforge::pipeline
namespace pageforge::storage {
class ObjectStore;
}

namespace pageforge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<pageforge::storage::ObjectStore>           store;
  std::shared_ptr<pageforge::pipeline::ConversionCoordinator> conversion;
  std::shared_ptr<pageforge::pipeline::UploadCoordinator>     upload;
  std::filesystem::path                                       scratch_root;
};

} // namespace pageforge::service
