#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace pageforge::storage::common {

namespace {

// "s3://bucket/prefix" -> "bucket/prefix"; bare "bucket/prefix" is kept.
arrow::Result<std::string> S3RootPath(const std::string& root_path) {
  if (root_path.find("://") == std::string::npos) {
    return root_path;
  }
  std::string resolved;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(root_path, &resolved));
  (void)fs;
  return resolved;
}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> MakeS3FileSystem(const pageforge::runtime::config::S3Options& proto_options) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();
  if (!proto_options.region().empty()) options.region = proto_options.region();
  if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
  if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
  if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
  if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();
  options.force_virtual_addressing = proto_options.force_virtual_addressing();
  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::static_pointer_cast<arrow::fs::FileSystem>(fs);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const pageforge::runtime::config::ObjectStoreConfig& config) {
  std::string resolved_path = config.root_path();

  switch (config.filesystem()) {
    case pageforge::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                            resolved_path);

    case pageforge::runtime::config::FILE_SYSTEM_S3: {
      ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3FileSystem(config.s3()));
      ARROW_ASSIGN_OR_RAISE(resolved_path, S3RootPath(config.root_path()));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case pageforge::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      if (resolved_path.rfind("s3://", 0) == 0) {
        ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(config.root_path(), &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace pageforge::storage::common
