#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace pageforge::storage {

/*
  Object store over an Arrow filesystem (S3 / MinIO, or local for dev).

  Characteristics:
    - whole-object writes, atomic per PUT on S3
    - Content-Type and ACL travel as output stream metadata
    - local filesystems ignore the metadata
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::shared_ptr<arrow::Buffer> Fetch(const std::string& remote_path) override;

  void Store(const std::string& remote_path, const std::shared_ptr<arrow::Buffer>& data, const ObjectAttributes& attributes) override;

  std::string ObjectPath(const std::string& remote_path) const;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace pageforge::storage
