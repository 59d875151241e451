#pragma once

#include <filesystem>
#include <string>

#include "internal/pipeline/upload_coordinator.hpp"
#include "pageforge/convert/v1.hpp"
#include "service_context.hpp"

namespace pageforge::service {

inline constexpr const char* kSourceField = "pdf";

pipeline::FormValues ToFormValues(const pageforge::convert::v1::ConvertRequest& req);

/*
  One conversion request end to end:

    validate form -> fetch source into scratch -> convert -> upload -> report

  Validation, source fetch and page counting failures throw and fail the
  request. Worker failures of either phase are returned in the response.
*/
class ConversionService {
 public:
  explicit ConversionService(ServiceContext ctx);

  pageforge::convert::v1::ConvertResponse Convert(const pageforge::convert::v1::ConvertRequest& req);

 private:
  void FetchSource(const std::string& remote_path, const std::filesystem::path& local_path) const;

  ServiceContext ctx_;
};

} // namespace pageforge::service
