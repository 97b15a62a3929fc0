#include "distpack/process.hpp"

#include "distpack/consts.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace distpack {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// Reap the child; kills it if it outlives the deadline. Returns the wait status.
int reap(pid_t pid, std::chrono::steady_clock::time_point deadline, bool has_deadline,
         bool &timed_out) {
  int status = 0;
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return status;
    if (r < 0 && errno != EINTR)
      return status;
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      timed_out = true;
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, std::chrono::seconds timeout) {
  if (argv.empty())
    throw std::invalid_argument("run_process: empty argv");

  ProcessResult res{};

  // Everything the child touches is prepared before fork().
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};  // child's stdout+stderr
  int exec_pipe[2] = {-1, -1}; // carries errno if execvp fails; closed on exec otherwise
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    res.error = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    res.error = std::string("pipe failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return res;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    res.error = std::string("fork failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return res;
  }

  if (pid == 0) {
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO)
        ::close(devnull);
    }
    ::execvp(cargv[0], cargv.data());
    const int err = errno;
    [[maybe_unused]] const auto n = ::write(exec_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(exec_pipe[1]);

  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    close_fd(out_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    res.error = argv[0] + ": " + std::strerror(exec_errno);
    return res;
  }
  res.spawned = true;

  // Clamped so the deadline arithmetic cannot overflow.
  const bool has_deadline = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() +
                        std::min(timeout, std::chrono::seconds(consts::kMaxToolTimeout));

  char buf[4096];
  for (;;) {
    if (has_deadline && std::chrono::steady_clock::now() >= deadline)
      break;
    pollfd pfd{.fd = out_pipe[0], .events = POLLIN, .revents = 0};
    const int pr = ::poll(&pfd, 1, 100);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (pr == 0)
      continue;
    const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (n == 0)
      break; // EOF: the child closed its end
    if (res.output.size() < consts::kMaxToolOutput) {
      const auto room = consts::kMaxToolOutput - res.output.size();
      res.output.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
    }
  }
  close_fd(out_pipe[0]);

  const int status = reap(pid, deadline, has_deadline, res.timed_out);
  if (!res.timed_out)
    res.exit_code = decode_status(status);
  return res;
}

} // namespace distpack
