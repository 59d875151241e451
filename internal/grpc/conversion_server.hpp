#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/conversion_service.hpp"
#include "pageforge/convert/v1.hpp"

namespace pageforge::grpc {

class ConversionServer final : public pageforge::convert::v1::ConversionService::Service {
 public:
  explicit ConversionServer(std::shared_ptr<pageforge::service::ConversionService> svc);

  ::grpc::Status Convert(::grpc::ServerContext* ctx, const pageforge::convert::v1::ConvertRequest* req,
                         pageforge::convert::v1::ConvertResponse* resp) override;

 private:
  std::shared_ptr<pageforge::service::ConversionService> service_;
};

} // namespace pageforge::grpc
