#include "conversion_server.hpp"

#include "grpc_error.hpp"

namespace pageforge::grpc {

ConversionServer::ConversionServer(std::shared_ptr<pageforge::service::ConversionService> svc) : service_(std::move(svc)) {
}

::grpc::Status ConversionServer::Convert(::grpc::ServerContext*, const pageforge::convert::v1::ConvertRequest* req,
                                         pageforge::convert::v1::ConvertResponse* resp) {
  try {
    *resp = service_->Convert(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace pageforge::grpc
