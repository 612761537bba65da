#include "SessionRegistry.hpp"

namespace wt {
void SessionRegistry::add(shared_ptr<Session> session) {
  lock_guard<std::mutex> guard(registryMutex);
  sessions[session->getId()] = session;
}

void SessionRegistry::remove(const string& sessionId) {
  lock_guard<std::mutex> guard(registryMutex);
  sessions.erase(sessionId);
}

int SessionRegistry::nudge(const TargetRef& target, const string& userIdentity,
                           const string& keystrokes) {
  vector<shared_ptr<Session>> matches;
  {
    lock_guard<std::mutex> guard(registryMutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
      auto session = it->second.lock();
      if (!session) {
        it = sessions.erase(it);
        continue;
      }
      if (session->getTarget() == target &&
          session->getUserIdentity() == userIdentity) {
        matches.push_back(session);
      }
      ++it;
    }
  }
  int nudged = 0;
  for (auto session : matches) {
    if (session->getState() == SessionState::OPEN) {
      session->send(keystrokes);
      nudged++;
    }
  }
  VLOG(1) << "Nudged " << nudged << " session(s) of '" << userIdentity
          << "' on " << target;
  return nudged;
}

size_t SessionRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  size_t live = 0;
  for (auto& it : sessions) {
    if (!it.second.expired()) {
      live++;
    }
  }
  return live;
}
}  // namespace wt
