#pragma once

#include "proctask/core/error.hpp"
#include "proctask/spec/task_spec.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace proctask {

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct EngineConfig {
  LogConfig log;
  std::vector<SpecOptions> tasks;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<EngineConfig>;
};

// Points the logger at the configured level and file.
[[nodiscard]] auto apply(const LogConfig& config) -> Result<void>;

}  // namespace proctask
