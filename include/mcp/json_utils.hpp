#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp {

template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  if (j.contains(key) && !j.at(key).is_null()) {
    value = j.at(key).get<T>();
  } else {
    value = std::nullopt;
  }
}

template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

template <typename T>
void from_json_required(
    const nlohmann::json& j, const std::string& key, T& value) {
  j.at(key).get_to(value);
}

template <typename T>
void to_json_required(
    nlohmann::json& j, const std::string& key, const T& value) {
  j[key] = value;
}

// Member `key` when it is a string, otherwise the fallback. Never throws on
// a type mismatch, unlike nlohmann::json::value.
inline auto string_or(
    const nlohmann::json& j, const std::string& key, std::string fallback = {})
    -> std::string {
  if (!j.is_object()) {
    return fallback;
  }
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

}  // namespace mcp
