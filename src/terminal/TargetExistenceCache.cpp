#include "TargetExistenceCache.hpp"

namespace wt {
TargetExistenceCache::TargetExistenceCache(
    shared_ptr<TargetDiscovery> _discovery, shared_ptr<Clock> _clock,
    std::chrono::milliseconds _ttl)
    : discovery(_discovery), clock(_clock), ttl(_ttl) {}

bool TargetExistenceCache::exists(const TargetRef& target) {
  if (!discovery->isWellFormed(target)) {
    VLOG(1) << "Not a valid target: " << targetKey(target);
    return false;
  }
  string key = targetKey(target);
  {
    lock_guard<std::mutex> guard(cacheMutex);
    auto it = entries.find(key);
    if (it != entries.end() && clock->now() - it->second.checkedAt < ttl) {
      VLOG(2) << "Cache hit for " << key << ": " << it->second.exists;
      return it->second.exists;
    }
  }

  // Query without the lock so slow discovery never blocks other keys.
  bool result;
  try {
    result = discovery->query(target);
  } catch (const QueryFailed& qf) {
    LOG(WARNING) << "Existence query for " << key << " failed: " << qf.what();
    return false;
  }
  Clock::TimePoint checkedAt = clock->now();

  lock_guard<std::mutex> guard(cacheMutex);
  pruneExpiredLocked(checkedAt);
  auto it = entries.find(key);
  if (it == entries.end() || it->second.checkedAt <= checkedAt) {
    entries[key] = {result, checkedAt};
  }
  VLOG(1) << "Target " << key << (result ? " exists" : " does not exist");
  return result;
}

void TargetExistenceCache::invalidate(const TargetRef& target) {
  lock_guard<std::mutex> guard(cacheMutex);
  entries.erase(targetKey(target));
}

void TargetExistenceCache::pruneExpiredLocked(Clock::TimePoint now) {
  for (auto it = entries.begin(); it != entries.end();) {
    if (now - it->second.checkedAt >= ttl) {
      it = entries.erase(it);
    } else {
      ++it;
    }
  }
}

size_t TargetExistenceCache::size() {
  lock_guard<std::mutex> guard(cacheMutex);
  return entries.size();
}
}  // namespace wt
