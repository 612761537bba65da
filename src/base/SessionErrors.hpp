#ifndef __WT_SESSION_ERRORS__
#define __WT_SESSION_ERRORS__

#include "Headers.hpp"

namespace wt {
/** @brief The remote-exec collaborator rejected the attach. */
class TargetUnreachable : public std::runtime_error {
 public:
  explicit TargetUnreachable(const string& what) : std::runtime_error(what) {}
};

/** @brief The caller may not attach to the target.  Never retried. */
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const string& what) : std::runtime_error(what) {}
};

/** @brief Mid-session I/O failure on a transport. */
class TransportBroken : public std::runtime_error {
 public:
  explicit TransportBroken(const string& what) : std::runtime_error(what) {}
};

/** @brief A malformed or unknown control message. */
class ProtocolViolation : public std::runtime_error {
 public:
  explicit ProtocolViolation(const string& what) : std::runtime_error(what) {}
};

class UploadValidationFailed : public std::runtime_error {
 public:
  explicit UploadValidationFailed(const string& what)
      : std::runtime_error(what) {}
};

class UploadTransportFailed : public std::runtime_error {
 public:
  explicit UploadTransportFailed(const string& what)
      : std::runtime_error(what) {}
};

/** @brief Target discovery could not produce an answer. */
class QueryFailed : public std::runtime_error {
 public:
  explicit QueryFailed(const string& what) : std::runtime_error(what) {}
};
}  // namespace wt

#endif  // __WT_SESSION_ERRORS__
