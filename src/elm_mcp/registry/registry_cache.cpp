#include "elm_mcp/registry/registry_cache.hpp"

#include <mutex>

#include <fmt/format.h>

namespace elm_mcp::registry {

RegistryCache::RegistryCache(
    std::size_t max_entries, std::chrono::seconds ttl,
    std::function<Clock::time_point()> now)
    : max_entries_(max_entries), ttl_(ttl), now_(std::move(now)) {
}

auto RegistryCache::Get(const std::string& key) const -> Value {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  // Expired entries stay until the next Put prunes them
  if (now_() - it->second.inserted_at >= ttl_) {
    return nullptr;
  }
  return it->second.value;
}

auto RegistryCache::Put(std::string key, nlohmann::json value) -> Value {
  auto stored = std::make_shared<const nlohmann::json>(std::move(value));
  if (max_entries_ == 0) {
    return stored;
  }

  std::unique_lock lock(mutex_);
  const auto now = now_();

  if (auto it = entries_.find(key); it != entries_.end()) {
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
  }

  PruneLocked(now);
  while (entries_.size() >= max_entries_ && !insertion_order_.empty()) {
    entries_.erase(insertion_order_.front());
    insertion_order_.pop_front();
  }

  insertion_order_.push_back(key);
  auto order = std::prev(insertion_order_.end());
  entries_.emplace(
      std::move(key),
      Entry{.value = stored, .inserted_at = now, .order = order});
  return stored;
}

void RegistryCache::PruneLocked(Clock::time_point now) {
  // Insertion order is also expiry order under a fixed TTL
  while (!insertion_order_.empty()) {
    auto it = entries_.find(insertion_order_.front());
    if (it != entries_.end() && now - it->second.inserted_at < ttl_) {
      break;
    }
    if (it != entries_.end()) {
      entries_.erase(it);
    }
    insertion_order_.pop_front();
  }
}

auto RegistryCache::Size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

auto RegistryCache::SearchKey() -> std::string {
  return "search:all";
}

auto RegistryCache::ReleasesKey(
    const std::string& author, const std::string& name) -> std::string {
  return fmt::format("releases:{}/{}", author, name);
}

auto RegistryCache::DocsKey(
    const std::string& author, const std::string& name,
    const std::string& version) -> std::string {
  return fmt::format("docs:{}/{}@{}", author, name, version);
}

}  // namespace elm_mcp::registry
