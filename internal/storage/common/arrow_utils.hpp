#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace pageforge::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw Error (std::runtime_error by default)
*/
template <typename Error = std::runtime_error, typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw Error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

template <typename Error = std::runtime_error>
void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw Error(status.ToString());
}

/*
  Filesystem and root path for the configured object store.

  FILE_SYSTEM_S3 builds S3Options from config; AUTO accepts any Arrow URI or
  a plain local path.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const pageforge::runtime::config::ObjectStoreConfig& config);

} // namespace pageforge::storage::common
