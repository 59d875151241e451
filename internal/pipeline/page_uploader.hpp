#pragma once

#include "internal/pipeline/conversion_job.hpp"
#include "internal/storage/object_store.hpp"

namespace pageforge::pipeline {

/*
  Publishes one local page image. Single attempt, no retry.
*/
class PageUploader {
 public:
  PageUploader(storage::ObjectStorePtr store, storage::ObjectAttributes attributes);

  // throws util::IOFailure for a missing, unreadable or empty local file and
  // util::RemoteFailure when the store rejects the write
  void Upload(const UploadTarget& target) const;

 private:
  storage::ObjectStorePtr   store_;
  storage::ObjectAttributes attributes_;
};

} // namespace pageforge::pipeline
