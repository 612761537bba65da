#ifndef __WT_RAW_SOCKET_UTILS__
#define __WT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Blocking write loops over raw POSIX descriptors (ptys, pipes, stdio).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);
};
}  // namespace wt
#endif  // __WT_RAW_SOCKET_UTILS__
