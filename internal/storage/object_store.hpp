#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace pageforge::storage {

enum class Visibility {
  kPrivate,
  kPublicRead,
};

struct ObjectAttributes {
  std::string content_type = "image/jpeg";
  Visibility  visibility   = Visibility::kPublicRead;
};

/*
  Remote object store abstraction.

  Paths are object keys relative to the store's root. Every object is moved
  as a whole Arrow Buffer; no partial reads or multipart handling here.

  Implementations:
    ArrowObjectStore → any Arrow filesystem (S3 / MinIO, local for dev)
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  /*
    Download a full object.

    throws util::RemoteFailure when the object is missing or unreadable.
  */
  virtual std::shared_ptr<arrow::Buffer> Fetch(const std::string& remote_path) = 0;

  /*
    Upload a buffer as one object, replacing any existing object.

    throws util::RemoteFailure when the store rejects the write.
  */
  virtual void Store(const std::string& remote_path, const std::shared_ptr<arrow::Buffer>& data, const ObjectAttributes& attributes) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace pageforge::storage
