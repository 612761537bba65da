#include "TimerScheduler.hpp"

namespace wt {
ThreadTimerScheduler::ThreadTimerScheduler() : nextId(1), halt(false) {
  workerThread.reset(new thread(&ThreadTimerScheduler::run, this));
}

ThreadTimerScheduler::~ThreadTimerScheduler() { shutdown(); }

TimerScheduler::TimerId ThreadTimerScheduler::schedule(
    std::chrono::milliseconds delay, function<void()> callback) {
  lock_guard<std::mutex> guard(timerMutex);
  TimerId id = nextId++;
  pending[id] = {std::chrono::steady_clock::now() + delay, callback};
  VLOG(1) << "Armed timer " << id << " for " << delay.count() << " ms";
  timerCv.notify_all();
  return id;
}

bool ThreadTimerScheduler::cancel(TimerId id) {
  lock_guard<std::mutex> guard(timerMutex);
  return pending.erase(id) > 0;
}

void ThreadTimerScheduler::shutdown() {
  {
    lock_guard<std::mutex> guard(timerMutex);
    if (halt) {
      return;
    }
    halt = true;
    pending.clear();
    timerCv.notify_all();
  }
  if (workerThread && workerThread->joinable()) {
    if (workerThread->get_id() == std::this_thread::get_id()) {
      workerThread->detach();
    } else {
      workerThread->join();
    }
  }
}

void ThreadTimerScheduler::run() {
  el::Helpers::setThreadName("Timer");
  std::unique_lock<std::mutex> lock(timerMutex);
  while (!halt) {
    if (pending.empty()) {
      timerCv.wait(lock);
      continue;
    }
    auto earliest = pending.begin();
    for (auto it = pending.begin(); it != pending.end(); ++it) {
      if (it->second.deadline < earliest->second.deadline) {
        earliest = it;
      }
    }
    if (std::chrono::steady_clock::now() < earliest->second.deadline) {
      timerCv.wait_until(lock, earliest->second.deadline);
      continue;
    }
    function<void()> callback = earliest->second.callback;
    VLOG(1) << "Firing timer " << earliest->first;
    pending.erase(earliest);
    // Run without the lock so callbacks may schedule or cancel timers.
    lock.unlock();
    callback();
    lock.lock();
  }
}
}  // namespace wt
