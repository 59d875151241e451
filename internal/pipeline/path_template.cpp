#include "path_template.hpp"

#include "internal/util/errors.hpp"

namespace pageforge::pipeline {

std::size_t CountPlaceholders(std::string_view path_template) {
  std::size_t count = 0;
  for (auto pos = path_template.find(kPagePlaceholder); pos != std::string_view::npos;
       pos      = path_template.find(kPagePlaceholder, pos + kPagePlaceholder.size())) {
    ++count;
  }
  return count;
}

void RequireSinglePlaceholder(std::string_view path_template, std::string_view what) {
  const auto count = CountPlaceholders(path_template);
  if (count == 1) {
    return;
  }
  throw util::ValidationFailure(std::string(what) + " must contain the page placeholder '" + std::string(kPagePlaceholder) +
                                "' exactly once, found " + std::to_string(count) + " in '" + std::string(path_template) + "'");
}

std::string ResolvePage(std::string_view path_template, int page) {
  const auto pos = path_template.find(kPagePlaceholder);
  if (pos == std::string_view::npos) {
    throw util::ValidationFailure("path template '" + std::string(path_template) + "' has no page placeholder");
  }

  std::string resolved;
  resolved.reserve(path_template.size() + 8);
  resolved.append(path_template.substr(0, pos));
  resolved.append(std::to_string(page));
  resolved.append(path_template.substr(pos + kPagePlaceholder.size()));
  return resolved;
}

std::string WithVariantSuffix(std::string_view path_template, ImageVariant variant) {
  const auto pos = path_template.find(kPagePlaceholder);
  if (pos == std::string_view::npos) {
    throw util::ValidationFailure("path template '" + std::string(path_template) + "' has no page placeholder");
  }

  const auto  split = pos + kPagePlaceholder.size();
  std::string derived(path_template.substr(0, split));
  derived.append(TemplateSuffix(variant));
  derived.append(path_template.substr(split));
  return derived;
}

const std::string& VariantTemplates::For(ImageVariant variant) const {
  switch (variant) {
    case ImageVariant::kSmall:
      return small;
    case ImageVariant::kLarge:
      return large;
    case ImageVariant::kNormal:
      break;
  }
  return normal;
}

VariantTemplates VariantTemplates::FromBase(std::string_view base_template) {
  RequireSinglePlaceholder(base_template, "base template");

  VariantTemplates templates;
  templates.normal = std::string(base_template);
  templates.small  = WithVariantSuffix(base_template, ImageVariant::kSmall);
  templates.large  = WithVariantSuffix(base_template, ImageVariant::kLarge);
  return templates;
}

} // namespace pageforge::pipeline
