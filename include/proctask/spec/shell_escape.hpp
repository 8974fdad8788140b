#pragma once

#include <span>
#include <string>
#include <string_view>

namespace proctask {

// Quotes arg so /bin/sh reads it as one literal word: the whole argument is
// single-quoted and each embedded quote becomes '\''.
[[nodiscard]] auto escape_shell_arg(std::string_view arg) -> std::string;

// base followed by each argument escaped, space-joined, surrounding
// whitespace trimmed.
[[nodiscard]] auto build_command_line(std::string_view base,
                                      std::span<const std::string> args)
    -> std::string;

[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

}  // namespace proctask
