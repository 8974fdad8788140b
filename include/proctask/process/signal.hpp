#pragma once

#include "proctask/core/error.hpp"

#include <csignal>
#include <string>
#include <string_view>

namespace proctask {

inline constexpr int kSigTerm = SIGTERM;
inline constexpr int kSigKill = SIGKILL;
inline constexpr int kSigAbrt = SIGABRT;

[[nodiscard]] constexpr auto is_valid_signal(int signo) noexcept -> bool {
  return signo > 0 && signo < NSIG;
}

// Accepts "TERM", "SIGTERM", "term" or a decimal number.
[[nodiscard]] auto parse_signal(std::string_view name) -> Result<int>;

// "SIGTERM" for known signals, "SIG<n>" otherwise.
[[nodiscard]] auto signal_name(int signo) -> std::string;

}  // namespace proctask
