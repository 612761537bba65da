#ifndef __WT_HEADERS__
#define __WT_HEADERS__

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <netdb.h>
#include <paths.h>
#include <pthread.h>
#include <pty.h>
#include <pwd.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "WebTerm.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Single-byte liveness probe.  Never produced by a real terminal stream and
// never shown to the user.
const char HEARTBEAT_BYTE = '\0';

// Client liveness defaults (milliseconds)
const int DEFAULT_LIVENESS_TIMEOUT_MS = 15 * 1000;

// Reconnection defaults
const int DEFAULT_MAX_RECONNECT_ATTEMPTS = 5;
const int DEFAULT_BACKOFF_BASE_MS = 1000;
const double DEFAULT_BACKOFF_MULTIPLIER = 2.0;

// Large paste handling defaults
const int DEFAULT_CHUNK_THRESHOLD = 1000;
const int DEFAULT_CHUNK_FRAGMENT_SIZE = 500;
const int DEFAULT_CHUNK_DELAY_MS = 50;

// Server defaults
const int DEFAULT_SERVER_PORT = 8006;
const int DEFAULT_IDLE_TIMEOUT_SECONDS = 300;
const int DEFAULT_CONNECTION_TIMEOUT_SECONDS = 3600;
const int DEFAULT_TARGET_CACHE_TTL_SECONDS = 300;
const string DEFAULT_UPLOAD_DIRECTORY = "/tmp";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef WT_VERSION
#define WT_VERSION "unknown"
#endif

namespace wt {
inline std::ostream &operator<<(std::ostream &os,
                                const wt::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

inline std::ostream &operator<<(std::ostream &os, const wt::TargetRef &target) {
  os << target.ns() << "/" << target.name();
  return os;
}

inline std::ostream &operator<<(std::ostream &os,
                                const wt::TerminalGeometry &geometry) {
  os << geometry.cols() << "x" << geometry.rows();
  return os;
}

inline TargetRef makeTargetRef(const string &ns, const string &name) {
  TargetRef target;
  target.set_ns(ns);
  target.set_name(name);
  return target;
}

inline TerminalGeometry makeGeometry(int cols, int rows) {
  TerminalGeometry geometry;
  geometry.set_cols(cols);
  geometry.set_rows(rows);
  return geometry;
}

inline bool isValidGeometry(const TerminalGeometry &geometry) {
  return geometry.cols() > 0 && geometry.rows() > 0 &&
         geometry.cols() <= 0xFFFF && geometry.rows() <= 0xFFFF;
}

/**
 * @brief Returns a stable string key for a target, suitable for maps.
 */
inline string targetKey(const TargetRef &target) {
  return target.ns() + "/" + target.name();
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Waits up to `timeoutMs` for `fd` to become readable.
 */
inline bool waitOnSocketData(int fd, int timeoutMs = 1000) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting fd " << fd;
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    FATAL_FAIL(rc);
  }
  return FD_ISSET(fd, &fdset);
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace wt

inline bool operator==(const google::protobuf::MessageLite &msg_a,
                       const google::protobuf::MessageLite &msg_b) {
  return (msg_a.GetTypeName() == msg_b.GetTypeName()) &&
         (msg_a.SerializeAsString() == msg_b.SerializeAsString());
}

inline bool operator!=(const google::protobuf::MessageLite &msg_a,
                       const google::protobuf::MessageLite &msg_b) {
  return (msg_a.GetTypeName() != msg_b.GetTypeName()) ||
         (msg_a.SerializeAsString() != msg_b.SerializeAsString());
}

#endif
