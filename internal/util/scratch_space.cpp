#include "scratch_space.hpp"

#include <random>
#include <string_view>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::util {

namespace {

constexpr std::string_view kAlphanumeric = "abcdefghijklmnopqrstuvwxyz0123456789";
constexpr int              kCreateAttempts = 4;

} // namespace

std::string RandomAlphanumeric(std::size_t length) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, kAlphanumeric.size() - 1);

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(kAlphanumeric[pick(rng)]);
  }
  return out;
}

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root) {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    throw IOFailure("cannot create scratch root " + root.string() + ": " + ec.message());
  }

  // create_directory reports false when the name is already taken
  for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
    auto candidate = root / RandomAlphanumeric(kScratchNameLength);
    if (std::filesystem::create_directory(candidate, ec)) {
      path_ = std::move(candidate);
      return;
    }
    if (ec) {
      throw IOFailure("cannot create scratch directory " + candidate.string() + ": " + ec.message());
    }
  }
  throw IOFailure("cannot allocate a unique scratch directory under " + root.string());
}

ScratchDirectory::~ScratchDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    PAGEFORGE_LOG_WARN("Failed to remove scratch directory",
                       {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace pageforge::util
