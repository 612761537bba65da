#ifndef __WT_TARGET_EXISTENCE_CACHE__
#define __WT_TARGET_EXISTENCE_CACHE__

#include "Clock.hpp"
#include "Headers.hpp"
#include "RemoteExec.hpp"

namespace wt {
/**
 * @brief Memoizes target discovery answers for a fixed TTL.
 *
 * Positive and negative answers are cached alike.  A failed query counts as
 * "does not exist" for that lookup only and is not cached.  Concurrent
 * refreshes of one key are allowed; the freshest answer wins.  Expired
 * entries are dropped whenever a fresh answer is stored, and malformed refs
 * are never queried or stored.
 */
class TargetExistenceCache {
 public:
  TargetExistenceCache(shared_ptr<TargetDiscovery> _discovery,
                       shared_ptr<Clock> _clock,
                       std::chrono::milliseconds _ttl = std::chrono::seconds(
                           DEFAULT_TARGET_CACHE_TTL_SECONDS));

  bool exists(const TargetRef& target);

  /** @brief Drops the cached answer for `target`, if any. */
  void invalidate(const TargetRef& target);

  size_t size();

 protected:
  struct Entry {
    bool exists;
    Clock::TimePoint checkedAt;
  };

  void pruneExpiredLocked(Clock::TimePoint now);

  shared_ptr<TargetDiscovery> discovery;
  shared_ptr<Clock> clock;
  std::chrono::milliseconds ttl;
  std::mutex cacheMutex;
  unordered_map<string, Entry> entries;
};
}  // namespace wt

#endif  // __WT_TARGET_EXISTENCE_CACHE__
