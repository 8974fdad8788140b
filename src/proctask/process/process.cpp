#include "proctask/process/process.hpp"

#include "proctask/process/signal.hpp"
#include "proctask/util/log.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace proctask {

namespace {

auto create_error_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto read_child_errno(int fd) -> std::optional<int> {
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    return child_errno;
  }
  return std::nullopt;
}

auto to_c_array(std::vector<std::string>& strings) -> std::vector<char*> {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for (auto& s : strings) {
    out.push_back(s.data());
  }
  out.push_back(nullptr);
  return out;
}

}  // namespace

auto find_executable(const std::string& name, const EnvMap& env)
    -> std::optional<std::filesystem::path> {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    return std::filesystem::path{name};
  }

  std::string_view path = "/usr/local/bin:/usr/bin:/bin";
  if (auto it = env.find("PATH"); it != env.end()) {
    path = it->second;
  } else if (const char* path_env = std::getenv("PATH")) {
    path = path_env;
  }
  while (!path.empty()) {
    auto pos = path.find(':');
    auto dir = path.substr(0, pos);
    path = pos == std::string_view::npos ? std::string_view{} : path.substr(pos + 1);
    if (dir.empty()) {
      dir = ".";
    }
    auto candidate = std::filesystem::path{dir} / name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

auto merge_environment(const EnvMap& overrides) -> std::vector<std::string> {
  std::vector<std::string> merged;
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    auto name = entry.substr(0, eq);
    if (overrides.contains(std::string(name))) {
      continue;
    }
    merged.emplace_back(entry);
  }
  for (const auto& [name, value] : overrides) {
    merged.push_back(name + "=" + value);
  }
  return merged;
}

auto decode_wait_status(int status) -> std::optional<ExitStatus> {
  if (WIFEXITED(status)) {
    return ExitStatus{.exit_code = WEXITSTATUS(status), .term_signal = std::nullopt};
  }
  if (WIFSIGNALED(status)) {
    return ExitStatus{.exit_code = std::nullopt, .term_signal = WTERMSIG(status)};
  }
  return std::nullopt;
}

auto spawn_process(const SpawnRequest& request) -> Result<pid_t> {
  if (request.argv.empty() || request.argv.front().empty()) {
    return fail(Error::InvalidArgument);
  }

  auto exe = find_executable(request.argv.front(), request.env);
  if (!exe) {
    log::error("Executable not found on PATH: {}", request.argv.front());
    return fail(Error::SpawnFailure);
  }

  // Everything the child touches is prepared here; a vfork child must not
  // allocate.
  std::string exe_path = exe->string();
  std::vector<std::string> args = request.argv;
  std::vector<std::string> env = merge_environment(request.env);
  std::vector<char*> argv = to_c_array(args);
  std::vector<char*> envp = to_c_array(env);
  std::string cwd = request.cwd.string();

  auto [read_fd, write_fd] = create_error_pipe();
  if (read_fd < 0) {
    log::error("Failed to create pipe: {}", strerror(errno));
    return fail(Error::SpawnFailure);
  }

  // The child shares our memory until exec; no handler of ours may run in it.
  sigset_t all_signals;
  sigset_t saved_mask;
  sigfillset(&all_signals);
  pthread_sigmask(SIG_SETMASK, &all_signals, &saved_mask);

  pid_t pid = vfork();
  if (pid < 0) {
    int err = errno;
    pthread_sigmask(SIG_SETMASK, &saved_mask, nullptr);
    close(read_fd);
    close(write_fd);
    log::error("vfork failed: {}", strerror(err));
    return fail(Error::SpawnFailure);
  }

  if (pid == 0) {
    // Child process - must only use async-signal-safe functions
    setpgid(0, 0);

    // Ignored dispositions and the blocked mask survive exec. Handlers are
    // reset while everything is still blocked.
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    for (int signo = 1; signo < NSIG; ++signo) {
      sigaction(signo, &dfl, nullptr);
    }
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
      int err = errno;
      (void)!write(write_fd, &err, sizeof(err));
      _exit(127);
    }

    execve(exe_path.c_str(), argv.data(), envp.data());
    int err = errno;
    (void)!write(write_fd, &err, sizeof(err));
    _exit(127);
  }

  pthread_sigmask(SIG_SETMASK, &saved_mask, nullptr);
  close(write_fd);
  setpgid(pid, pid);

  auto child_errno = read_child_errno(read_fd);
  close(read_fd);

  if (child_errno) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    log::error("Failed to start '{}' in {}: {}", exe_path, cwd,
               strerror(*child_errno));
    return fail(Error::SpawnFailure);
  }

  return ok(pid);
}

auto poll_process(pid_t pid) -> Result<std::optional<ExitStatus>> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }

  int status = 0;
  pid_t r = 0;
  do {
    r = waitpid(pid, &status, WNOHANG);
  } while (r < 0 && errno == EINTR);

  if (r == 0) {
    return ok(std::optional<ExitStatus>{});
  }
  if (r < 0) {
    int err = errno;
    if (err == ECHILD) {
      log::warn("waitpid: pid {} is not a child of this process", pid);
      return fail(Error::ProcessLost);
    }
    log::warn("waitpid failed for pid {}: {}", pid, strerror(err));
    return fail(std::error_code{err, std::system_category()});
  }

  return ok(decode_wait_status(status));
}

auto send_signal(pid_t pid, int signo) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (!is_valid_signal(signo)) {
    return fail(Error::SignalFailure);
  }

  if (kill(-pid, signo) == 0) {
    return ok();
  }
  if (kill(pid, signo) == 0) {
    return ok();
  }
  int err = errno;
  if (err == ESRCH) {
    log::warn("Signal {} not delivered, pid {} already exited",
              signal_name(signo), pid);
    return ok();
  }
  log::warn("kill({}, {}) failed: {}", pid, signal_name(signo), strerror(err));
  return fail(std::error_code{err, std::system_category()});
}

}  // namespace proctask
