#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace pageforge::service {
class ConversionService;
}

namespace pageforge::factory {

/*
  Application

  Everything the daemon owns for its lifetime.
*/
struct Application {
  std::shared_ptr<service::ConversionService>   conversion_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows the concrete object store and
  raster backend types.
*/
Application Build(const pageforge::runtime::config::RuntimeConfig& config);

} // namespace pageforge::factory
