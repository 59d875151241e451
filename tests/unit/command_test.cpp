#include "internal/raster/command.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/raster/ghostscript_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

using pageforge::raster::Command;
using pageforge::raster::GhostscriptBackend;
using pageforge::raster::GhostscriptOptions;
using pageforge::util::IOFailure;

template <typename Fn>
bool ThrowsIOFailure(Fn&& fn) {
  try {
    fn();
  } catch (const IOFailure&) {
    return true;
  }
  return false;
}

void TestCapturesStdout() {
  const auto output = Command("/bin/sh").Arg("-c").Arg("echo 42").Run();
  assert(output == "42\n");
}

void TestArgumentsAreNotShellExpanded() {
  const auto output = Command("/bin/sh").Arg("-c").Arg("printf '%s' \"$0\"").Arg("a b;c").Run();
  assert(output == "a b;c");
}

void TestNonZeroExitThrows() {
  assert(ThrowsIOFailure([] { (void)Command("/bin/sh").Arg("-c").Arg("exit 3").Run(); }));
}

void TestMissingProgramThrows() {
  assert(ThrowsIOFailure([] { (void)Command("/nonexistent/pageforge-rasterizer").Run(); }));
}

void TestConcurrentInvocations() {
  std::vector<std::thread> threads;
  std::vector<std::string> outputs(8);
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([i, &outputs] { outputs[static_cast<std::size_t>(i)] = Command("/bin/sh").Arg("-c").Arg("echo " + std::to_string(i)).Run(); });
  }
  for (auto& thread : threads) thread.join();
  for (int i = 0; i < 8; ++i) {
    assert(outputs[static_cast<std::size_t>(i)] == std::to_string(i) + "\n");
  }
}

void TestGhostscriptInvocations() {
  GhostscriptOptions options;
  options.resolution_dpi = 200;
  GhostscriptBackend backend(options);

  const auto raster = backend.RasterizeCommand("/tmp/doc.pdf", {4, 4}, "/tmp/page4-large.jpg").Repr();
  assert(raster ==
         "gs -dNOPAUSE -dBATCH -sDEVICE=jpeg -dFirstPage=4 -dLastPage=4 -sOutputFile=/tmp/page4-large.jpg -dJPEGQ=90 -r200 -q /tmp/doc.pdf");

  const auto resize = backend.ResizeCommand("/tmp/page4-large.jpg", 800, 800, "/tmp/page4.jpg").Repr();
  assert(resize == "convert /tmp/page4-large.jpg -resize 800x800> -quality 90 /tmp/page4.jpg");

  const auto count = backend.CountCommand("/tmp/we(ird).pdf").Argv();
  assert(count.back() == "(/tmp/we\\(ird\\).pdf) (r) file runpdfbegin pdfpagecount = quit");
}

void TestCountPagesThroughFakeRasterizer() {
  const auto dir    = std::filesystem::temp_directory_path() / "pageforge_command_tests";
  const auto script = dir / "fake-gs";
  std::filesystem::create_directories(dir);
  {
    std::ofstream out(script);
    out << "#!/bin/sh\necho '  17  '\n";
  }
  std::filesystem::permissions(script, std::filesystem::perms::owner_all);

  GhostscriptOptions options;
  options.rasterizer_binary = script.string();
  GhostscriptBackend backend(options);
  assert(backend.CountPages("/tmp/doc.pdf") == 17);
}

} // namespace

int main() {
  TestCapturesStdout();
  TestArgumentsAreNotShellExpanded();
  TestNonZeroExitThrows();
  TestMissingProgramThrows();
  TestConcurrentInvocations();
  TestGhostscriptInvocations();
  TestCountPagesThroughFakeRasterizer();

  std::cout << "pageforge_unit_command: pass\n";
  return 0;
}
