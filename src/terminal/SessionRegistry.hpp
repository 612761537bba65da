#ifndef __WT_SESSION_REGISTRY__
#define __WT_SESSION_REGISTRY__

#include "Headers.hpp"
#include "Session.hpp"

namespace wt {
/**
 * @brief Tracks the live server-side Sessions so uploads can poke the shell
 * of the user who sent the file.
 */
class SessionRegistry {
 public:
  void add(shared_ptr<Session> session);

  void remove(const string& sessionId);

  /**
   * @brief Sends `keystrokes` to every open Session of `userIdentity` on
   * `target`.
   * @return How many Sessions were nudged.
   */
  int nudge(const TargetRef& target, const string& userIdentity,
            const string& keystrokes = "\r");

  size_t size();

 protected:
  std::mutex registryMutex;
  map<string, weak_ptr<Session>> sessions;
};
}  // namespace wt

#endif  // __WT_SESSION_REGISTRY__
