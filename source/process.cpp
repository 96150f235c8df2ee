#include <gitcmd/error.hpp>
#include <gitcmd/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace gitcmd {

namespace {

// what the child reports through the status pipe before exec
struct SpawnFailure {
  int stage; // 0: chdir, 1: stdin, 2: exec
  int err;
};

int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipes {
  int out[2]{-1, -1};
  int err[2]{-1, -1};
  int status[2]{-1, -1};

  ~Pipes() {
    for (int *p : {out, err, status}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  }
};

[[noreturn]] void child_fail(int fd, int stage) {
  SpawnFailure f{stage, errno};
  (void)!::write(fd, &f, sizeof(f));
  _exit(127);
}

// Drains both pipes until EOF on each; reading one to completion first
// would deadlock once the child fills the other.
void drain(int out_fd, int err_fd, std::string &out, std::string &err) {
  std::array<char, 4096> buf{};
  std::array<pollfd, 2> fds{pollfd{out_fd, POLLIN, 0},
                            pollfd{err_fd, POLLIN, 0}};
  std::array<std::string *, 2> sinks{&out, &err};
  int open_count = 2;

  while (open_count > 0) {
    int rc = ::poll(fds.data(), fds.size(), -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

int wait_exit_code(pid_t pid) {
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
}

} // namespace

std::string format_command(const std::string &binary,
                           const std::vector<std::string> &args) {
  std::ostringstream oss;
  oss << binary;
  for (const auto &a : args) {
    oss << ' ';
    if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos)
      oss << '\'' << a << '\'';
    else
      oss << a;
  }
  return oss.str();
}

ProcessOutput GitProcessRunner::run(const fs::path &cwd,
                                    const std::vector<std::string> &args) {
  const std::string &bin = cfg_.git_binary;
  spdlog::debug("[git] exec: {} (cwd={})", format_command(bin, args),
                cwd.string());

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(bin.c_str()));
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  Pipes p;
  if (make_cloexec_pipe(p.out) != 0 || make_cloexec_pipe(p.err) != 0 ||
      make_cloexec_pipe(p.status) != 0) {
    int e = errno;
    throw EnvironmentError(bin, e,
                           fmt::format("pipe failed: {}", std::strerror(e)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    throw EnvironmentError(bin, e,
                           fmt::format("fork failed: {}", std::strerror(e)));
  }

  if (pid == 0) {
    ::close(p.status[0]);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      child_fail(p.status[1], 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull < 0)
      child_fail(p.status[1], 1);
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
    ::dup2(p.out[1], STDOUT_FILENO);
    ::dup2(p.err[1], STDERR_FILENO);

    if (!cfg_.terminal_prompt)
      ::setenv("GIT_TERMINAL_PROMPT", "0", 1);
    for (auto &[k, v] : cfg_.env)
      ::setenv(k.c_str(), v.c_str(), 1);

    ::execvp(argv[0], argv.data());
    child_fail(p.status[1], 2);
  }

  close_fd(p.out[1]);
  close_fd(p.err[1]);
  close_fd(p.status[1]);

  SpawnFailure f{};
  ssize_t n;
  do {
    n = ::read(p.status[0], &f, sizeof(f));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    (void)wait_exit_code(pid);
    spdlog::debug("[git] spawn failed (stage={}, errno={}): {}", f.stage,
                  f.err, std::strerror(f.err));
    if (f.stage == 0)
      throw PathNotFound(cwd);
    if (f.stage == 2 &&
        (f.err == ENOENT || f.err == EACCES || f.err == ENOTDIR))
      throw BinaryNotFound(bin, f.err);
    throw EnvironmentError(bin, f.err,
                           fmt::format("{}: spawn failed: {}", bin,
                                       std::strerror(f.err)));
  }

  ProcessOutput r{};
  try {
    drain(p.out[0], p.err[0], r.out, r.err);
  } catch (...) {
    close_fd(p.out[0]);
    close_fd(p.err[0]);
    (void)wait_exit_code(pid);
    throw;
  }
  r.exit_code = wait_exit_code(pid);
  spdlog::debug("[git] exit={} ({} bytes out, {} bytes err)", r.exit_code,
                r.out.size(), r.err.size());
  return r;
}

std::shared_ptr<ProcessRunner> default_runner() {
  return std::make_shared<GitProcessRunner>(Config::from_env());
}

} // namespace gitcmd
