#include "proctask/process/signal.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <utility>

namespace proctask {

namespace {

constexpr std::array<std::pair<std::string_view, int>, 16> kSignals{{
    {"HUP", SIGHUP},
    {"INT", SIGINT},
    {"QUIT", SIGQUIT},
    {"ILL", SIGILL},
    {"TRAP", SIGTRAP},
    {"ABRT", SIGABRT},
    {"BUS", SIGBUS},
    {"FPE", SIGFPE},
    {"KILL", SIGKILL},
    {"USR1", SIGUSR1},
    {"SEGV", SIGSEGV},
    {"USR2", SIGUSR2},
    {"PIPE", SIGPIPE},
    {"ALRM", SIGALRM},
    {"TERM", SIGTERM},
    {"CONT", SIGCONT},
}};

}  // namespace

auto parse_signal(std::string_view name) -> Result<int> {
  if (name.empty()) {
    return fail(Error::SignalFailure);
  }

  if (std::isdigit(static_cast<unsigned char>(name.front()))) {
    int signo = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), signo);
    if (ec != std::errc{} || ptr != name.data() + name.size() ||
        !is_valid_signal(signo)) {
      return fail(Error::SignalFailure);
    }
    return ok(signo);
  }

  std::string upper(name);
  std::ranges::transform(upper, upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  std::string_view key = upper;
  if (key.starts_with("SIG")) {
    key.remove_prefix(3);
  }

  auto it = std::ranges::find(kSignals, key, &std::pair<std::string_view, int>::first);
  if (it == kSignals.end()) {
    return fail(Error::SignalFailure);
  }
  return ok(it->second);
}

auto signal_name(int signo) -> std::string {
  auto it = std::ranges::find(kSignals, signo, &std::pair<std::string_view, int>::second);
  if (it == kSignals.end()) {
    return std::format("SIG{}", signo);
  }
  return std::format("SIG{}", it->first);
}

}  // namespace proctask
