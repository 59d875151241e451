#pragma once

#include <filesystem>
#include <string_view>

#include "internal/raster/raster_backend.hpp"

namespace pageforge::pipeline {

// Upper bound on a document's page count; keeps 3 x pages within int.
inline constexpr int kMaxPageCount = 1'000'000;

/*
  Parses the rasterizer's metadata output: one base-10 integer, surrounding
  whitespace ignored. throws util::IOFailure on anything else, or on a
  count above kMaxPageCount.
*/
int ParsePageCount(std::string_view output);

class PageCounter {
 public:
  explicit PageCounter(raster::RasterBackendPtr backend);

  // throws util::IOFailure; there is no fallback counting strategy
  int CountPages(const std::filesystem::path& document) const;

 private:
  raster::RasterBackendPtr backend_;
};

} // namespace pageforge::pipeline
