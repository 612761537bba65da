#ifndef __WT_CLOCK__
#define __WT_CLOCK__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Monotonic time source.  Injected wherever timing decisions are made
 * so tests can drive time explicitly.
 */
class Clock {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;

  virtual ~Clock() {}

  virtual TimePoint now() = 0;
};

class SystemClock : public Clock {
 public:
  virtual ~SystemClock() {}

  virtual TimePoint now() { return std::chrono::steady_clock::now(); }
};
}  // namespace wt

#endif  // __WT_CLOCK__
