#include "page_uploader.hpp"

#include <arrow/io/file.h>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/page_converter.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::pipeline {

using storage::common::Unwrap;

PageUploader::PageUploader(storage::ObjectStorePtr store, storage::ObjectAttributes attributes)
    : store_(std::move(store)), attributes_(std::move(attributes)) {
}

void PageUploader::Upload(const UploadTarget& target) const {
  RequireNonEmptyFile(target.local_path);

  auto file   = Unwrap<util::IOFailure>(arrow::io::ReadableFile::Open(target.local_path));
  auto size   = Unwrap<util::IOFailure>(file->GetSize());
  auto buffer = Unwrap<util::IOFailure>(file->Read(size));
  Unwrap<util::IOFailure>(file->Close());

  if (buffer->size() != size) {
    throw util::IOFailure("short read of " + target.local_path + ": " + std::to_string(buffer->size()) + " of " + std::to_string(size) +
                          " bytes");
  }

  store_->Store(target.remote_path, buffer, attributes_);

  PAGEFORGE_LOG_DEBUG("Uploaded page image", {observability::IntField("page", target.page_number),
                                              observability::StringField("variant", VariantName(target.variant)),
                                              observability::StringField("remote_path", target.remote_path),
                                              observability::IntField("bytes", size)});
}

} // namespace pageforge::pipeline
