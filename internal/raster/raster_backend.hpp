#pragma once

#include <filesystem>
#include <memory>

#include "internal/pipeline/partition_planner.hpp"

namespace pageforge::raster {

/*
  Rasterizer / resizer capability.

  Implementations may shell out, link a native library or call a remote
  service. All methods block until the output exists or throw
  pageforge::util::IOFailure. Implementations must be safe to call from
  several worker threads at once.
*/
class RasterBackend {
 public:
  virtual ~RasterBackend() = default;

  // Total number of pages in the document; no rendering.
  virtual int CountPages(const std::filesystem::path& document) = 0;

  // Renders the pages of range into output. Workers pass single-page ranges.
  virtual void RasterizePage(const std::filesystem::path& document, const pipeline::PageRange& range,
                             const std::filesystem::path& output) = 0;

  // Scales source into a max_width x max_height box keeping aspect ratio.
  // Never upscales.
  virtual void Resize(const std::filesystem::path& source, int max_width, int max_height,
                      const std::filesystem::path& destination) = 0;
};

using RasterBackendPtr = std::shared_ptr<RasterBackend>;

} // namespace pageforge::raster
