#pragma once

#include "proctask/core/error.hpp"

#include <sys/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proctask {

using EnvMap = std::map<std::string, std::string>;

struct SpawnRequest {
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  EnvMap env;  // overlaid on the inherited environment
};

// Decoded wait status. Exactly one of the two fields is set.
struct ExitStatus {
  std::optional<int> exit_code;
  std::optional<int> term_signal;

  [[nodiscard]] auto signaled() const noexcept -> bool {
    return term_signal.has_value();
  }
};

// Starts argv[0] in its own process group. argv[0] without a slash is looked
// up on the PATH the child will see. Exec and chdir failures in the child surface as SpawnFailure.
[[nodiscard]] auto spawn_process(const SpawnRequest& request) -> Result<pid_t>;

// Non-blocking. Returns nullopt while the child is alive; otherwise reaps it.
[[nodiscard]] auto poll_process(pid_t pid)
    -> Result<std::optional<ExitStatus>>;

// Signals the child's process group. A child that is already gone is not an
// error.
[[nodiscard]] auto send_signal(pid_t pid, int signo) -> Result<void>;

[[nodiscard]] auto decode_wait_status(int status) -> std::optional<ExitStatus>;

// Inherited environment with overrides applied, as NAME=VALUE strings.
[[nodiscard]] auto merge_environment(const EnvMap& overrides)
    -> std::vector<std::string>;

// Resolves a bare name against PATH from env, falling back to our own PATH.
// Only regular executable files match.
[[nodiscard]] auto find_executable(const std::string& name,
                                   const EnvMap& env = {})
    -> std::optional<std::filesystem::path>;

}  // namespace proctask
