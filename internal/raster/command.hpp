#pragma once

#include <string>
#include <vector>

namespace pageforge::raster {

/*
  External program invocation.

  Arguments are passed to execvp() verbatim, no shell is involved. The child
  inherits stderr; stdout is captured.
*/
class Command {
 public:
  explicit Command(std::string program);

  Command& Arg(std::string arg);
  Command& Arg(int value);

  // Runs to completion and returns captured stdout.
  // throws util::IOFailure when the program cannot be started, is killed by
  // a signal or exits non-zero.
  std::string Run() const;

  std::string Repr() const;

  const std::vector<std::string>& Argv() const {
    return argv_;
  }

 private:
  std::vector<std::string> argv_;
};

} // namespace pageforge::raster
