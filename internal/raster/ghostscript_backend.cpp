#include "ghostscript_backend.hpp"

#include <utility>

#include "internal/pipeline/page_counter.hpp"
#include "internal/util/errors.hpp"

namespace pageforge::raster {

namespace {

// PostScript string literal: backslash and parentheses must be escaped.
std::string PostScriptString(const std::string& value) {
  std::string out = "(";
  for (char c : value) {
    if (c == '\\' || c == '(' || c == ')') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back(')');
  return out;
}

} // namespace

GhostscriptBackend::GhostscriptBackend(GhostscriptOptions options) : options_(std::move(options)) {
}

Command GhostscriptBackend::CountCommand(const std::filesystem::path& document) const {
  Command command(options_.rasterizer_binary);
  command.Arg("-q").Arg("-dNODISPLAY").Arg("-dNOSAFER").Arg("-c");
  command.Arg(PostScriptString(document.string()) + " (r) file runpdfbegin pdfpagecount = quit");
  return command;
}

Command GhostscriptBackend::RasterizeCommand(const std::filesystem::path& document, const pipeline::PageRange& range,
                                             const std::filesystem::path& output) const {
  Command command(options_.rasterizer_binary);
  command.Arg("-dNOPAUSE")
      .Arg("-dBATCH")
      .Arg("-sDEVICE=jpeg")
      .Arg("-dFirstPage=" + std::to_string(range.first))
      .Arg("-dLastPage=" + std::to_string(range.last))
      .Arg("-sOutputFile=" + output.string())
      .Arg("-dJPEGQ=" + std::to_string(options_.jpeg_quality))
      .Arg("-r" + std::to_string(options_.resolution_dpi))
      .Arg("-q")
      .Arg(document.string());
  return command;
}

Command GhostscriptBackend::ResizeCommand(const std::filesystem::path& source, int max_width, int max_height,
                                          const std::filesystem::path& destination) const {
  // '>' only shrinks images larger than the box
  Command command(options_.resizer_binary);
  command.Arg(source.string())
      .Arg("-resize")
      .Arg(std::to_string(max_width) + "x" + std::to_string(max_height) + ">")
      .Arg("-quality")
      .Arg(options_.jpeg_quality)
      .Arg(destination.string());
  return command;
}

int GhostscriptBackend::CountPages(const std::filesystem::path& document) {
  return pipeline::ParsePageCount(CountCommand(document).Run());
}

void GhostscriptBackend::RasterizePage(const std::filesystem::path& document, const pipeline::PageRange& range,
                                       const std::filesystem::path& output) {
  if (range.Size() != 1 && output.string().find("%d") == std::string::npos) {
    throw util::IOFailure("multi-page rasterization needs a %d output template, got " + output.string());
  }
  RasterizeCommand(document, range, output).Run();
}

void GhostscriptBackend::Resize(const std::filesystem::path& source, int max_width, int max_height,
                                const std::filesystem::path& destination) {
  ResizeCommand(source, max_width, max_height, destination).Run();
}

} // namespace pageforge::raster
