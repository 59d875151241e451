#include "command.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "internal/util/errors.hpp"

namespace pageforge::raster {

namespace {

// exec failures are reported through this exit code; errno travels on error_pipe
constexpr int kExecFailedStatus = 127;

std::string ErrnoMessage(const std::string& context, int error) {
  return context + ": " + std::strerror(error);
}

/*
  Owns the two ends of a pipe opened with O_CLOEXEC.
*/
class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) < 0) {
      throw util::IOFailure(ErrnoMessage("pipe2()", errno));
    }
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReadEnd() const {
    return fds_[0];
  }
  int WriteEnd() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }

  void CloseWrite() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2] = {-1, -1};
};

std::string ReadAll(int fd, const std::string& context) {
  std::string out;
  char        buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof buffer);
    if (n > 0) {
      out.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) break;
    if (errno == EINTR) continue;
    throw util::IOFailure(ErrnoMessage(context + ": read()", errno));
  }
  return out;
}

int WaitFor(pid_t pid, const std::string& context) {
  int status = 0;
  for (;;) {
    if (::waitpid(pid, &status, 0) >= 0) return status;
    if (errno != EINTR) throw util::IOFailure(ErrnoMessage(context + ": waitpid()", errno));
  }
}

} // namespace

Command::Command(std::string program) {
  argv_.push_back(std::move(program));
}

Command& Command::Arg(std::string arg) {
  argv_.push_back(std::move(arg));
  return *this;
}

Command& Command::Arg(int value) {
  return Arg(std::to_string(value));
}

std::string Command::Repr() const {
  std::string repr;
  for (const auto& arg : argv_) {
    if (!repr.empty()) repr.push_back(' ');
    repr.append(arg);
  }
  return repr;
}

std::string Command::Run() const {
  const std::string context = argv_.front();

  std::vector<char*> c_argv;
  c_argv.reserve(argv_.size() + 1);
  for (const auto& arg : argv_) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  Pipe stdout_pipe;
  Pipe error_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::IOFailure(ErrnoMessage(context + ": fork()", errno));
  }

  if (pid == 0) {
    // child: async-signal-safe calls only
    if (::dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO) < 0) {
      const int error = errno;
      (void)!::write(error_pipe.WriteEnd(), &error, sizeof error);
      ::_exit(kExecFailedStatus);
    }
    ::execvp(c_argv[0], c_argv.data());
    const int error = errno;
    (void)!::write(error_pipe.WriteEnd(), &error, sizeof error);
    ::_exit(kExecFailedStatus);
  }

  stdout_pipe.CloseWrite();
  error_pipe.CloseWrite();

  std::string output;
  std::string exec_error;
  std::string read_error;
  try {
    output     = ReadAll(stdout_pipe.ReadEnd(), context);
    exec_error = ReadAll(error_pipe.ReadEnd(), context);
  } catch (const util::IOFailure& e) {
    read_error = e.what();
  }

  // always reap the child, even when reading failed
  const int status = WaitFor(pid, context);

  if (exec_error.size() >= sizeof(int)) {
    int error = 0;
    std::memcpy(&error, exec_error.data(), sizeof error);
    throw util::IOFailure(ErrnoMessage("cannot execute " + context, error));
  }
  if (!read_error.empty()) {
    throw util::IOFailure(read_error);
  }
  if (WIFSIGNALED(status)) {
    throw util::IOFailure(context + " was killed by signal " + std::to_string(WTERMSIG(status)) + ": " + Repr());
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    throw util::IOFailure(context + " exited with status " + std::to_string(WEXITSTATUS(status)) + ": " + Repr());
  }
  return output;
}

} // namespace pageforge::raster
