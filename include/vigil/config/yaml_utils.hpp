#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {

template <>
struct convert<std::chrono::seconds> {
  static auto encode(const std::chrono::seconds& s) -> Node {
    return Node(s.count());
  }
  static auto decode(const Node& node, std::chrono::seconds& s) -> bool {
    if (!node.IsScalar()) return false;
    s = std::chrono::seconds(node.as<long long>());
    return true;
  }
};

}  // namespace YAML

namespace vigil {

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

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   std::string_view value) {
  if (!value.empty()) {
    out << YAML::Key << std::string(key) << YAML::Value << std::string(value);
  }
}

inline void yaml_emit_list(YAML::Emitter& out, std::string_view key,
                           const std::vector<std::string>& values) {
  out << YAML::Key << std::string(key) << YAML::Value << YAML::Flow
      << YAML::BeginSeq;
  for (const auto& v : values) {
    out << v;
  }
  out << YAML::EndSeq;
}

}  // namespace vigil
