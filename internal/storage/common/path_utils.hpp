#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace pageforge::storage::common {

/*
  Object keys come from callers. Reject anything that could escape the
  store root once joined.
*/
inline void ValidateObjectKey(std::string_view key) {
  if (key.empty()) {
    throw util::ValidationFailure("object key must not be empty");
  }
  if (key.front() == '/') {
    throw util::ValidationFailure("object key must be relative: " + std::string(key));
  }

  std::size_t start = 0;
  while (start <= key.size()) {
    const auto end     = key.find('/', start);
    const auto segment = key.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (segment == "." || segment == "..") {
      throw util::ValidationFailure("object key must not contain relative path components: " + std::string(key));
    }
    if (end == std::string_view::npos) break;
    start = end + 1;
  }

  for (char c : key) {
    if (c == '\\' || c == '\0') {
      throw util::ValidationFailure("object key contains invalid character: " + std::string(key));
    }
  }
}

inline std::string JoinObjectKey(const std::string& root, std::string_view key) {
  ValidateObjectKey(key);
  if (root.empty()) {
    return std::string(key);
  }
  if (root.back() == '/') {
    return root + std::string(key);
  }
  return root + "/" + std::string(key);
}

} // namespace pageforge::storage::common
