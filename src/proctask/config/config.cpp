#include "proctask/config/config.hpp"

#include "proctask/config/yaml_utils.hpp"
#include "proctask/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<proctask::LogConfig> {
  static bool decode(const Node& node, proctask::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = proctask::yaml_get_or<std::string>(node, "level", "info");
    l.file = proctask::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<proctask::SpecOptions> {
  static bool decode(const Node& node, proctask::SpecOptions& o) {
    if (!node.IsMap()) {
      return false;
    }
    o.id = proctask::yaml_get_optional<std::string>(node, "id");
    o.name = proctask::yaml_get_optional<std::string>(node, "name");
    o.cmd = proctask::yaml_get_optional<std::string>(node, "cmd", "command");
    o.script = proctask::yaml_get_optional<std::string>(node, "script", "file");
    o.interpreter =
        proctask::yaml_get_optional<std::string>(node, "interpreter", "php");
    // Without an explicit kind, an interpreter entry selects the interpreter
    // variant.
    if (auto kind = node["kind"]) {
      o.kind = proctask::parse<proctask::SpecKind>(kind.as<std::string>());
    } else {
      o.kind = o.interpreter ? proctask::SpecKind::Interpreter
                             : proctask::SpecKind::Shell;
    }
    if (auto cwd = proctask::yaml_get_optional<std::string>(node, "cwd")) {
      o.cwd = std::filesystem::path{*cwd};
    }
    if (auto args = node["args"]) {
      o.args = args.as<std::vector<std::string>>();
    }
    if (auto env = node["env"]) {
      o.env = env.as<proctask::EnvMap>();
    }
    o.daemon = proctask::yaml_get_optional<bool>(node, "daemon");
    if (auto ms = proctask::yaml_get_optional<long long>(node, "timeout_ms",
                                                          "timeout")) {
      o.timeout = std::chrono::milliseconds{*ms};
    }
    o.trust_exit_code =
        proctask::yaml_get_optional<bool>(node, "trust_exit_code");
    return true;
  }
};

template <>
struct convert<proctask::EngineConfig> {
  static bool decode(const Node& node, proctask::EngineConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto log = node["log"]) {
      c.log = log.as<proctask::LogConfig>();
    }
    if (auto tasks = node["tasks"]) {
      c.tasks = tasks.as<std::vector<proctask::SpecOptions>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace proctask {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<EngineConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    EngineConfig config = root.as<EngineConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto apply(const LogConfig& config) -> Result<void> {
  log::set_level(config.level);
  if (!log::set_file(config.file)) {
    log::error("Failed to open log file: {}", config.file);
    return fail(Error::FileNotFound);
  }
  return ok();
}

}  // namespace proctask
