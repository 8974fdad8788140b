#include "proctask/task/task.hpp"

#include "proctask/process/process.hpp"
#include "proctask/util/log.hpp"

#include <stdexcept>
#include <utility>

namespace proctask {

Task::Task(std::unique_ptr<TaskSpec> spec) : spec_(std::move(spec)) {
  if (!spec_) {
    throw std::invalid_argument("Task requires a spec");
  }
}

Task::~Task() {
  if (status_ == TaskStatus::Running && spec_) {
    log::warn("Task '{}' ({}) dropped while pid {} is still running", name(),
              id(), *pid_);
  }
}

Task::Task(Task&& other) noexcept
    : spec_(std::move(other.spec_)),
      status_(std::exchange(other.status_, TaskStatus::New)),
      pid_(std::exchange(other.pid_, std::nullopt)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)),
      term_signal_(std::exchange(other.term_signal_, std::nullopt)),
      started_at_(std::exchange(other.started_at_, std::nullopt)),
      ended_at_(std::exchange(other.ended_at_, std::nullopt)),
      timed_out_(std::exchange(other.timed_out_, false)) {}

Task& Task::operator=(Task&& other) noexcept {
  if (this != &other) {
    Task tmp(std::move(other));
    std::swap(spec_, tmp.spec_);
    std::swap(status_, tmp.status_);
    std::swap(pid_, tmp.pid_);
    std::swap(exit_code_, tmp.exit_code_);
    std::swap(term_signal_, tmp.term_signal_);
    std::swap(started_at_, tmp.started_at_);
    std::swap(ended_at_, tmp.ended_at_);
    std::swap(timed_out_, tmp.timed_out_);
  }
  return *this;
}

auto Task::run() -> Result<void> {
  if (!spec_) {
    return fail(Error::InvalidState);
  }
  if (status_ != TaskStatus::New) {
    log::warn("Task '{}' ({}) cannot run from state {}", name(), id(),
              to_string_view(status_));
    return fail(Error::InvalidState);
  }

  SpawnRequest request{
      .argv = spec_->argv(), .cwd = spec_->cwd(), .env = spec_->env()};

  auto started = Clock::now();
  auto pid = spawn_process(request);
  if (!pid) {
    log::error("Failed to spawn task '{}' ({}): {}", name(), id(),
               pid.error().message());
    return fail(pid.error());
  }

  pid_ = *pid;
  started_at_ = started;
  status_ = TaskStatus::Running;
  log::debug("Task '{}' ({}) started as pid {} in {}: {}", name(), id(), *pid_,
             spec_->cwd().string(), spec_->command());
  return ok();
}

auto Task::status_check() -> Result<TaskStatus> {
  switch (status_) {
    case TaskStatus::New:
      return fail(Error::InvalidState);
    case TaskStatus::Complete:
    case TaskStatus::Signaled:
      return ok(status_);
    case TaskStatus::Running:
      break;
  }

  auto polled = poll_process(*pid_);
  if (!polled) {
    return fail(polled.error());
  }

  if (!polled->has_value()) {
    enforce_timeout();
    return ok(status_);
  }

  const ExitStatus& exit = **polled;
  ended_at_ = Clock::now();
  if (exit.signaled()) {
    term_signal_ = exit.term_signal;
    status_ = TaskStatus::Signaled;
    log::info("Task '{}' ({}) pid {} killed by {} after {:.3f}s", name(), id(),
              *pid_, signal_name(*term_signal_), runtime().count());
  } else {
    exit_code_ = exit.exit_code;
    status_ = TaskStatus::Complete;
    log::info("Task '{}' ({}) pid {} exited with code {} after {:.3f}s", name(),
              id(), *pid_, *exit_code_, runtime().count());
  }
  return ok(status_);
}

auto Task::enforce_timeout() -> void {
  if (timed_out_ || spec_->is_daemon()) {
    return;
  }
  auto limit = spec_->timeout();
  if (limit.count() <= 0 || Clock::now() - *started_at_ <= limit) {
    return;
  }

  log::warn("Task '{}' ({}) exceeded its {}ms timeout, sending {}", name(),
            id(), limit.count(), signal_name(kSigTerm));
  if (auto r = send_signal(*pid_, kSigTerm); !r) {
    // Retried on the next poll.
    log::warn("Timeout signal for task '{}' failed: {}", name(),
              r.error().message());
    return;
  }
  timed_out_ = true;
}

auto Task::terminate(int signo) -> Result<void> {
  if (!spec_) {
    return fail(Error::InvalidState);
  }
  if (status_ != TaskStatus::Running) {
    log::warn("Cannot signal task '{}' ({}) in state {}", name(), id(),
              to_string_view(status_));
    return fail(Error::InvalidState);
  }
  if (!is_valid_signal(signo)) {
    return fail(Error::SignalFailure);
  }

  log::debug("Sending {} to task '{}' ({}) pid {}", signal_name(signo), name(),
             id(), *pid_);
  return send_signal(*pid_, signo);
}

auto Task::runtime() const -> std::chrono::duration<double> {
  if (!started_at_) {
    return std::chrono::duration<double>::zero();
  }
  auto end = ended_at_.value_or(Clock::now());
  return std::chrono::duration<double>(end - *started_at_);
}

}  // namespace proctask
