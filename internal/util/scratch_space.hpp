#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace pageforge::util {

inline constexpr std::size_t kScratchNameLength = 50;

// [a-z0-9]{length}
std::string RandomAlphanumeric(std::size_t length);

/*
  Per-request working directory, <root>/<50 random characters>.

  Created on construction and removed recursively on destruction. Holds the
  downloaded source document and every intermediate page image.
*/
class ScratchDirectory {
 public:
  explicit ScratchDirectory(const std::filesystem::path& root);
  ~ScratchDirectory();

  ScratchDirectory(const ScratchDirectory&)            = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace pageforge::util
