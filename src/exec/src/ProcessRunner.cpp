/**
 * @file ProcessRunner.cpp
 * @brief fork/execvp subprocess execution with captured output.
 */

#include "src/exec/inc/ProcessRunner.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <fcntl.h>    // fcntl, open, O_NONBLOCK, O_RDONLY
#include <poll.h>     // poll, pollfd
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid, WIFEXITED
#include <unistd.h>   // fork, execvp, pipe2, dup2, read, close, _exit

#include <cerrno>
#include <cstring> // strerror
#include <vector>

namespace kindling {

namespace exec {

namespace {

using helpers::clock::getMonotonicMs;

/// Pipe pair closed on scope exit.
struct Pipe {
  int fds[2]{-1, -1};

  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    closeRead();
    closeWrite();
  }

  [[nodiscard]] bool open() noexcept { return ::pipe2(fds, O_CLOEXEC) == 0; }

  void closeRead() noexcept {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }

  void closeWrite() noexcept {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
};

void setNonBlocking(int fd) noexcept {
  const int FLAGS = ::fcntl(fd, F_GETFL, 0);
  if (FLAGS >= 0) {
    ::fcntl(fd, F_SETFL, FLAGS | O_NONBLOCK);
  }
}

/// Read everything currently available; closes the pipe end on EOF or error.
void drain(Pipe& pipe, std::string& sink) noexcept {
  char buf[4096];
  for (;;) {
    const ssize_t N = ::read(pipe.fds[0], buf, sizeof(buf));
    if (N > 0) {
      sink.append(buf, static_cast<std::size_t>(N));
      continue;
    }
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    pipe.closeRead();
    return;
  }
}

int decodeWaitStatus(int status) noexcept {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

/* ----------------------------- ProcessRunner ----------------------------- */

CmdResult ProcessRunner::run(const CommandLine& cmd, std::chrono::milliseconds timeout) {
  CmdResult result;
  log_->debug("exec: {}", cmd.display());

  Pipe outPipe;
  Pipe errPipe;
  if (!outPipe.open() || !errPipe.open()) {
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    log_->warn("exec: {}", result.err);
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(cmd.argv().size() + 1);
  for (const std::string& a : cmd.argv()) {
    cargv.push_back(const_cast<char*>(a.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.err = std::string("fork failed: ") + std::strerror(errno);
    log_->warn("exec: {}", result.err);
    return result;
  }

  if (PID == 0) {
    const int DEVNULL = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (DEVNULL >= 0) {
      ::dup2(DEVNULL, STDIN_FILENO);
    }
    ::dup2(outPipe.fds[1], STDOUT_FILENO);
    ::dup2(errPipe.fds[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    _exit(EXIT_NOT_FOUND);
  }

  outPipe.closeWrite();
  errPipe.closeWrite();
  setNonBlocking(outPipe.fds[0]);
  setNonBlocking(errPipe.fds[0]);

  const std::uint64_t DEADLINE = getMonotonicMs() + static_cast<std::uint64_t>(timeout.count());

  while (outPipe.fds[0] >= 0 || errPipe.fds[0] >= 0) {
    const std::uint64_t NOW = getMonotonicMs();
    if (NOW >= DEADLINE) {
      result.timedOut = true;
      ::kill(PID, SIGKILL);
      break;
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    int idxOut = -1;
    int idxErr = -1;
    if (outPipe.fds[0] >= 0) {
      idxOut = static_cast<int>(nfds);
      fds[nfds++] = pollfd{outPipe.fds[0], POLLIN, 0};
    }
    if (errPipe.fds[0] >= 0) {
      idxErr = static_cast<int>(nfds);
      fds[nfds++] = pollfd{errPipe.fds[0], POLLIN, 0};
    }

    const int PR = ::poll(fds, nfds, static_cast<int>(DEADLINE - NOW));
    if (PR < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(PID, SIGKILL);
      result.err = std::string("poll failed: ") + std::strerror(errno);
      break;
    }

    if (idxOut >= 0 && fds[idxOut].revents != 0) {
      drain(outPipe, result.out);
    }
    if (idxErr >= 0 && fds[idxErr].revents != 0) {
      drain(errPipe, result.err);
    }
  }

  int status = 0;
  while (::waitpid(PID, &status, 0) < 0 && errno == EINTR) {
  }
  result.exitCode = decodeWaitStatus(status);

  if (result.timedOut) {
    log_->warn("exec: '{}' killed after {} ms", cmd.program(), timeout.count());
  } else {
    log_->debug("exec: '{}' exited {}", cmd.program(), result.exitCode);
  }
  return result;
}

} // namespace exec

} // namespace kindling
