#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/pipeline/image_variant.hpp"

namespace pageforge::pipeline {

/*
  Path templates carry exactly one page-number placeholder, e.g.
  "scans/page%d.jpg". Resolution replaces it with the decimal page number.
*/
inline constexpr std::string_view kPagePlaceholder = "%d";

std::size_t CountPlaceholders(std::string_view path_template);

inline bool HasSinglePlaceholder(std::string_view path_template) {
  return CountPlaceholders(path_template) == 1;
}

// throws util::ValidationFailure unless the template has exactly one placeholder
void RequireSinglePlaceholder(std::string_view path_template, std::string_view what);

std::string ResolvePage(std::string_view path_template, int page);

/*
  "page%d.jpg" + kSmall -> "page%d-small.jpg". The suffix is joined to the
  placeholder before substitution so page 3 resolves to "page3-small.jpg".
*/
std::string WithVariantSuffix(std::string_view path_template, ImageVariant variant);

/*
  One template per variant.
*/
struct VariantTemplates {
  std::string normal;
  std::string small;
  std::string large;

  const std::string& For(ImageVariant variant) const;

  // Derives the small and large templates from a normal-variant template.
  static VariantTemplates FromBase(std::string_view base_template);
};

} // namespace pageforge::pipeline
