#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace proctask {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// First present key wins; for options that accept an alias.
template <YamlParsable T>
[[nodiscard]] auto yaml_get_optional(const YAML::Node& node,
                                     std::string_view key,
                                     std::string_view alias = {})
    -> std::optional<T> {
  for (auto k : {key, alias}) {
    if (k.empty()) {
      continue;
    }
    auto field = node[std::string(k)];
    if (field && !field.IsNull()) {
      return field.as<T>();
    }
  }
  return std::nullopt;
}

}  // namespace proctask
