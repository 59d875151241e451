#pragma once

#include <array>
#include <string_view>

namespace pageforge::pipeline {

/*
  The three derivatives produced for every page. They differ only in the
  bounding box the image is scaled into.
*/
enum class ImageVariant {
  kSmall,
  kNormal,
  kLarge,
};

// Upload order for one page.
inline constexpr std::array<ImageVariant, 3> kUploadOrder = {ImageVariant::kNormal, ImageVariant::kSmall, ImageVariant::kLarge};

inline constexpr int kUnbounded = 0;

// Longest allowed edge in pixels; kUnbounded for the raw rasterization.
constexpr int MaxDimension(ImageVariant variant) {
  switch (variant) {
    case ImageVariant::kSmall:
      return 300;
    case ImageVariant::kNormal:
      return 800;
    case ImageVariant::kLarge:
      return kUnbounded;
  }
  return kUnbounded;
}

// Literal inserted right after the page placeholder of the base template.
constexpr std::string_view TemplateSuffix(ImageVariant variant) {
  switch (variant) {
    case ImageVariant::kSmall:
      return "-small";
    case ImageVariant::kNormal:
      return "";
    case ImageVariant::kLarge:
      return "-large";
  }
  return "";
}

constexpr std::string_view VariantName(ImageVariant variant) {
  switch (variant) {
    case ImageVariant::kSmall:
      return "small";
    case ImageVariant::kNormal:
      return "normal";
    case ImageVariant::kLarge:
      return "large";
  }
  return "unknown";
}

} // namespace pageforge::pipeline
