#pragma once

#include <string>

#include "internal/raster/command.hpp"
#include "internal/raster/raster_backend.hpp"

namespace pageforge::raster {

struct GhostscriptOptions {
  std::string rasterizer_binary = "gs";
  std::string resizer_binary    = "convert";
  int         resolution_dpi    = 300;
  int         jpeg_quality      = 90;
};

/*
  Ghostscript for page counting and rasterization, ImageMagick for resizing.
  Every call runs one child process; nothing is shared between calls.
*/
class GhostscriptBackend final : public RasterBackend {
 public:
  explicit GhostscriptBackend(GhostscriptOptions options);

  int CountPages(const std::filesystem::path& document) override;

  void RasterizePage(const std::filesystem::path& document, const pipeline::PageRange& range,
                     const std::filesystem::path& output) override;

  void Resize(const std::filesystem::path& source, int max_width, int max_height,
              const std::filesystem::path& destination) override;

  // Exposed for tests; builds the invocation without running it.
  Command CountCommand(const std::filesystem::path& document) const;
  Command RasterizeCommand(const std::filesystem::path& document, const pipeline::PageRange& range,
                           const std::filesystem::path& output) const;
  Command ResizeCommand(const std::filesystem::path& source, int max_width, int max_height,
                        const std::filesystem::path& destination) const;

 private:
  GhostscriptOptions options_;
};

} // namespace pageforge::raster
