#include "page_counter.hpp"

#include <charconv>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::pipeline {

namespace {

std::string_view Trim(std::string_view value) {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  const auto                 begin       = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) return {};
  const auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

} // namespace

int ParsePageCount(std::string_view output) {
  const auto trimmed = Trim(output);
  if (trimmed.empty()) {
    throw util::IOFailure("rasterizer printed no page count");
  }

  int        count = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), count, 10);
  if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
    throw util::IOFailure("cannot parse page count from rasterizer output '" + std::string(trimmed) + "'");
  }
  if (count < 0) {
    throw util::IOFailure("rasterizer reported a negative page count " + std::to_string(count));
  }
  if (count > kMaxPageCount) {
    throw util::IOFailure("page count " + std::to_string(count) + " exceeds limit " + std::to_string(kMaxPageCount));
  }
  return count;
}

PageCounter::PageCounter(raster::RasterBackendPtr backend) : backend_(std::move(backend)) {
}

int PageCounter::CountPages(const std::filesystem::path& document) const {
  int count = 0;
  try {
    count = backend_->CountPages(document);
  } catch (const util::IOFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw util::IOFailure("counting pages of " + document.string() + ": " + e.what());
  }

  if (count < 0) {
    throw util::IOFailure("negative page count for " + document.string());
  }
  if (count > kMaxPageCount) {
    throw util::IOFailure("page count " + std::to_string(count) + " of " + document.string() + " exceeds limit " +
                          std::to_string(kMaxPageCount));
  }

  PAGEFORGE_LOG_INFO("Counted pages", {observability::StringField("document", document.string()),
                                       observability::IntField("pages", count)});
  return count;
}

} // namespace pageforge::pipeline
