#pragma once

#include "proctask/core/error.hpp"
#include "proctask/process/signal.hpp"
#include "proctask/spec/task_spec.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace proctask {

enum class TaskStatus : std::uint8_t {
  New,
  Running,
  Complete,  // exited normally, exit_code() is set
  Signaled,  // killed by a signal, term_signal() is set
};

[[nodiscard]] constexpr auto to_string_view(TaskStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case TaskStatus::New: return "new";
    case TaskStatus::Running: return "running";
    case TaskStatus::Complete: return "complete";
    case TaskStatus::Signaled: return "signaled";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Complete || status == TaskStatus::Signaled;
}

// Supervises one OS process started from one TaskSpec.
//
// New -> Running -> {Complete | Signaled}. A Task runs once; build a new one
// to run the spec again. Nothing happens in the background: the child is
// observed, reaped and timed out only inside status_check(), which never
// blocks. One caller polls a given Task at a time.
class Task {
public:
  using Clock = std::chrono::steady_clock;

  // Throws std::invalid_argument on a null spec.
  explicit Task(std::unique_ptr<TaskSpec> spec);
  ~Task();

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;
  // A moved-from Task is New with no spec: run() and terminate() return
  // InvalidState, and id(), name() and spec() must not be called.
  Task(Task&& other) noexcept;
  Task& operator=(Task&& other) noexcept;

  // New -> Running. InvalidState if already started; SpawnFailure leaves the
  // task in New.
  [[nodiscard]] auto run() -> Result<void>;

  // Non-blocking poll. Captures the exit code or terminating signal on the
  // first observation of the child's death and is a pure read afterwards.
  // While running, a non-daemon spec past its timeout is sent SIGTERM once;
  // the Signaled state shows up on a later call.
  auto status_check() -> Result<TaskStatus>;

  // Sends signo to the running child. Status is unchanged until the next
  // status_check(). InvalidState before run() and once terminal.
  [[nodiscard]] auto terminate(int signo = kSigTerm) -> Result<void>;

  [[nodiscard]] auto pid() const noexcept -> std::optional<pid_t> {
    return pid_;
  }
  [[nodiscard]] auto status() const noexcept -> TaskStatus {
    return status_;
  }
  [[nodiscard]] auto exit_code() const noexcept -> std::optional<int> {
    return exit_code_;
  }
  [[nodiscard]] auto term_signal() const noexcept -> std::optional<int> {
    return term_signal_;
  }
  [[nodiscard]] auto timed_out() const noexcept -> bool {
    return timed_out_;
  }
  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return proctask::is_terminal(status_);
  }

  // Seconds since run(): zero before, live while running, frozen once
  // terminal.
  [[nodiscard]] auto runtime() const -> std::chrono::duration<double>;

  [[nodiscard]] auto id() const noexcept -> const TaskId& {
    return spec_->id();
  }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return spec_->name();
  }
  [[nodiscard]] auto spec() const noexcept -> const TaskSpec& {
    return *spec_;
  }

private:
  auto enforce_timeout() -> void;

  std::unique_ptr<TaskSpec> spec_;
  TaskStatus status_{TaskStatus::New};
  std::optional<pid_t> pid_;
  std::optional<int> exit_code_;
  std::optional<int> term_signal_;
  std::optional<Clock::time_point> started_at_;
  std::optional<Clock::time_point> ended_at_;
  bool timed_out_{false};
};

}  // namespace proctask
