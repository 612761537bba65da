#ifndef __WT_TIMER_SCHEDULER__
#define __WT_TIMER_SCHEDULER__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Schedules one-shot callbacks after a delay.
 */
class TimerScheduler {
 public:
  typedef uint64_t TimerId;

  virtual ~TimerScheduler() {}

  /**
   * @brief Arms a one-shot timer.  The callback runs on a scheduler-owned
   * thread.
   */
  virtual TimerId schedule(std::chrono::milliseconds delay,
                           function<void()> callback) = 0;

  /**
   * @brief Cancels a pending timer.  Returns false if it already fired or was
   * never armed.
   */
  virtual bool cancel(TimerId id) = 0;
};

/**
 * @brief TimerScheduler backed by a single worker thread.
 */
class ThreadTimerScheduler : public TimerScheduler {
 public:
  ThreadTimerScheduler();

  virtual ~ThreadTimerScheduler();

  virtual TimerId schedule(std::chrono::milliseconds delay,
                           function<void()> callback);

  virtual bool cancel(TimerId id);

  /** @brief Stops the worker.  Pending timers never fire. */
  void shutdown();

 protected:
  struct PendingTimer {
    std::chrono::steady_clock::time_point deadline;
    function<void()> callback;
  };

  void run();

  std::mutex timerMutex;
  std::condition_variable timerCv;
  map<TimerId, PendingTimer> pending;
  TimerId nextId;
  bool halt;
  shared_ptr<thread> workerThread;
};
}  // namespace wt

#endif  // __WT_TIMER_SCHEDULER__
