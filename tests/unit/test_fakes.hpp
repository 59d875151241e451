#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/pipeline/conversion_job.hpp"
#include "internal/raster/raster_backend.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/scratch_space.hpp"

namespace pageforge::testing {

inline std::filesystem::path MakeTempDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "pageforge_unit_tests" / (test_name + "-" + util::RandomAlphanumeric(8));
  std::filesystem::create_directories(dir);
  return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/*
  Writes small text "images" instead of running Ghostscript.
*/
class FakeRasterBackend : public raster::RasterBackend {
 public:
  explicit FakeRasterBackend(int page_count) : page_count_(page_count) {
  }

  int CountPages(const std::filesystem::path& document) override {
    if (count_fails) throw util::IOFailure("gs: cannot open document");
    std::lock_guard lock(mutex_);
    counted_document_ = ReadFile(document);
    return page_count_;
  }

  void RasterizePage(const std::filesystem::path&, const pipeline::PageRange& range, const std::filesystem::path& output) override {
    {
      std::lock_guard lock(mutex_);
      rasterized_.push_back(range.first);
    }
    if (failing_pages.count(range.first)) {
      throw util::IOFailure("gs exited with status 1 on page " + std::to_string(range.first));
    }
    if (empty_pages.count(range.first)) {
      WriteFile(output, "");
      return;
    }
    WriteFile(output, "large-page-" + std::to_string(range.first));
  }

  void Resize(const std::filesystem::path& source, int max_width, int max_height, const std::filesystem::path& destination) override {
    {
      std::lock_guard lock(mutex_);
      resizes_.push_back(source.filename().string() + "->" + std::to_string(max_width) + "x" + std::to_string(max_height));
    }
    WriteFile(destination, ReadFile(source) + "@" + std::to_string(max_width));
  }

  std::vector<int> Rasterized() const {
    std::lock_guard lock(mutex_);
    return rasterized_;
  }

  // contents of the document passed to the last CountPages call
  std::string CountedDocument() const {
    std::lock_guard lock(mutex_);
    return counted_document_;
  }

  std::vector<std::string> Resizes() const {
    std::lock_guard lock(mutex_);
    return resizes_;
  }

  bool          count_fails = false;
  std::set<int> failing_pages;
  std::set<int> empty_pages;

 private:
  int                      page_count_;
  mutable std::mutex       mutex_;
  std::vector<int>         rasterized_;
  std::vector<std::string> resizes_;
  std::string              counted_document_;
};

/*
  In-memory object store recording every call.
*/
class RecordingObjectStore : public storage::ObjectStore {
 public:
  struct Object {
    std::string               data;
    storage::ObjectAttributes attributes;
  };

  std::shared_ptr<arrow::Buffer> Fetch(const std::string& remote_path) override {
    ++fetch_calls;
    std::lock_guard lock(mutex_);
    auto it = objects_.find(remote_path);
    if (it == objects_.end()) throw util::RemoteFailure("NoSuchKey: " + remote_path);
    return arrow::Buffer::FromString(it->second.data);
  }

  void Store(const std::string& remote_path, const std::shared_ptr<arrow::Buffer>& data, const storage::ObjectAttributes& attributes) override {
    ++store_calls;
    if (rejected_paths.count(remote_path)) {
      throw util::RemoteFailure("AccessDenied: " + remote_path);
    }
    std::lock_guard lock(mutex_);
    objects_[remote_path] = Object{data->ToString(), attributes};
  }

  void Put(const std::string& remote_path, const std::string& data) {
    std::lock_guard lock(mutex_);
    objects_[remote_path] = Object{data, {}};
  }

  std::map<std::string, Object> Objects() const {
    std::lock_guard lock(mutex_);
    return objects_;
  }

  std::atomic<int>      fetch_calls{0};
  std::atomic<int>      store_calls{0};
  std::set<std::string> rejected_paths;

 private:
  mutable std::mutex            mutex_;
  std::map<std::string, Object> objects_;
};

// Local page images for pages [1, page_count] under dir.
inline pipeline::ConversionJob MakeConvertedJob(const std::filesystem::path& dir, int page_count) {
  pipeline::ConversionJob job;
  job.source_path     = dir / "source.pdf";
  job.local_templates = pipeline::VariantTemplates::FromBase((dir / "page%d.jpg").string());
  job.page_count      = page_count;
  for (int page = 1; page <= page_count; ++page) {
    WriteFile(pipeline::ResolvePage(job.local_templates.normal, page), "normal-" + std::to_string(page));
    WriteFile(pipeline::ResolvePage(job.local_templates.small, page), "small-" + std::to_string(page));
    WriteFile(pipeline::ResolvePage(job.local_templates.large, page), "large-" + std::to_string(page));
  }
  return job;
}

} // namespace pageforge::testing
