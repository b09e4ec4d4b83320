#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace elm_mcp::registry {

// Bounded map of decoded registry documents.
//
// Entries expire after the TTL and the oldest insertion is evicted once the
// size bound is reached. Lookups take a shared lock only, so concurrent
// readers never wait on each other. A zero size bound disables caching.
class RegistryCache {
 public:
  using Clock = std::chrono::steady_clock;
  using Value = std::shared_ptr<const nlohmann::json>;

  RegistryCache(
      std::size_t max_entries, std::chrono::seconds ttl,
      std::function<Clock::time_point()> now = Clock::now);

  [[nodiscard]] auto Get(const std::string& key) const -> Value;

  // Replaces any existing entry and returns the stored value
  auto Put(std::string key, nlohmann::json value) -> Value;

  [[nodiscard]] auto Size() const -> std::size_t;

  // Key helpers, one namespace per registry endpoint
  static auto SearchKey() -> std::string;
  static auto ReleasesKey(const std::string& author, const std::string& name)
      -> std::string;
  static auto DocsKey(
      const std::string& author, const std::string& name,
      const std::string& version) -> std::string;

 private:
  struct Entry {
    Value value;
    Clock::time_point inserted_at;
    std::list<std::string>::iterator order;
  };

  // Caller holds the exclusive lock
  void PruneLocked(Clock::time_point now);

  std::size_t max_entries_;
  std::chrono::seconds ttl_;
  std::function<Clock::time_point()> now_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  // Oldest insertion first
  std::list<std::string> insertion_order_;
};

}  // namespace elm_mcp::registry
