#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::storage {

using common::Unwrap;
using util::RemoteFailure;

namespace {

const char* CannedAcl(Visibility visibility) {
  switch (visibility) {
    case Visibility::kPublicRead:
      return "public-read";
    case Visibility::kPrivate:
      break;
  }
  return "private";
}

std::shared_ptr<const arrow::KeyValueMetadata> ObjectMetadata(const ObjectAttributes& attributes) {
  return arrow::key_value_metadata({"Content-Type", "ACL"}, {attributes.content_type, CannedAcl(attributes.visibility)});
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

/*
  Object key layout:

      <root_path>/<remote_path>
*/
std::string ArrowObjectStore::ObjectPath(const std::string& remote_path) const {
  return common::JoinObjectKey(root_path_, remote_path);
}

std::shared_ptr<arrow::Buffer> ArrowObjectStore::Fetch(const std::string& remote_path) {
  const auto path  = ObjectPath(remote_path);
  auto       input = Unwrap<RemoteFailure>(fs_->OpenInputFile(path));
  auto       size  = Unwrap<RemoteFailure>(input->GetSize());
  auto       data  = Unwrap<RemoteFailure>(input->Read(size));
  Unwrap<RemoteFailure>(input->Close());
  return data;
}

void ArrowObjectStore::Store(const std::string& remote_path, const std::shared_ptr<arrow::Buffer>& data,
                             const ObjectAttributes& attributes) {
  const auto path = ObjectPath(remote_path);

  // local directories must exist before a file can be opened; object stores
  // have no directories
  if (fs_->type_name() == "local") {
    const auto parent = std::filesystem::path(path).parent_path().string();
    if (!parent.empty()) {
      Unwrap<RemoteFailure>(fs_->CreateDir(parent, /*recursive=*/true));
    }
  }

  auto out = Unwrap<RemoteFailure>(fs_->OpenOutputStream(path, ObjectMetadata(attributes)));
  Unwrap<RemoteFailure>(out->Write(data));
  Unwrap<RemoteFailure>(out->Close());
}

} // namespace pageforge::storage
