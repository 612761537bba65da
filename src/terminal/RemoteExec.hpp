#ifndef __WT_REMOTE_EXEC__
#define __WT_REMOTE_EXEC__

#include "Headers.hpp"
#include "SessionErrors.hpp"

namespace wt {
enum class TransportReadResult {
  /** @brief `payload` holds bytes from the remote side. */
  DATA,
  /** @brief Nothing arrived within the timeout. */
  TIMEOUT,
  /** @brief The remote side ended the stream cleanly. */
  CLOSED
};

/**
 * @brief Duplex byte channel to a remote process plus an out-of-band resize
 * sink.  Owned by exactly one Session.
 *
 * One thread reads while another writes; implementations must allow that.
 */
class RemoteTransport {
 public:
  virtual ~RemoteTransport() {}

  /**
   * @brief Waits up to `timeoutMs` for remote output.
   * @throws TransportBroken on I/O failure or an unclean remote exit.
   */
  virtual TransportReadResult read(string* payload, int timeoutMs) = 0;

  /**
   * @brief Writes bytes to the remote stdin.
   * @throws TransportBroken
   */
  virtual void write(const string& payload) = 0;

  /**
   * @brief Applies new geometry to the remote pseudo-terminal.
   * @throws TransportBroken
   */
  virtual void resize(const TerminalGeometry& geometry) = 0;

  /** @brief Releases the channel.  Called exactly once by the owner. */
  virtual void close() = 0;
};

/**
 * @brief Opens transports to remote targets.
 */
class RemoteExecutor {
 public:
  virtual ~RemoteExecutor() {}

  /**
   * @throws TargetUnreachable if the target rejects the attach.
   * @throws PermissionDenied if the caller may not attach.
   */
  virtual shared_ptr<RemoteTransport> attach(
      const TargetRef& target, const TerminalGeometry& geometry) = 0;
};

/**
 * @brief Receives remote output destined for the terminal renderer.
 */
class TerminalSink {
 public:
  virtual ~TerminalSink() {}

  virtual void write(const string& s) = 0;
};

/**
 * @brief Answers whether a target exists.
 */
class TargetDiscovery {
 public:
  virtual ~TargetDiscovery() {}

  /** @throws QueryFailed when no answer can be obtained. */
  virtual bool query(const TargetRef& target) = 0;

  /** @brief False for refs that can never name a target. */
  virtual bool isWellFormed(const TargetRef& target) { return true; }
};

/**
 * @brief Fire-and-forget record of connection events.
 */
class AuditSink {
 public:
  virtual ~AuditSink() {}

  virtual void record(const AuditRecord& record) = 0;
};

/**
 * @brief Pull-based byte stream for uploads.
 */
class ByteSource {
 public:
  virtual ~ByteSource() {}

  /** @brief Reads up to `count` bytes; returns 0 at end of stream. */
  virtual size_t read(char* buf, size_t count) = 0;

  /** @brief Total size in bytes, or -1 if unknown. */
  virtual int64_t size() = 0;
};

/**
 * @brief Delivers a byte stream to a path on a target, out of band from any
 * interactive session.
 */
class BulkTransfer {
 public:
  /**
   * @brief Called after each chunk with the running byte count.  Returning
   * false cancels the transfer.
   */
  typedef function<bool(int64_t bytesSent)> ProgressFn;

  virtual ~BulkTransfer() {}

  /**
   * @throws UploadTransportFailed on failure or cancellation.  A cancelled or
   * failed put never leaves a partial file at `destPath`.
   */
  virtual void put(const TargetRef& target, const string& destPath,
                   ByteSource* source, ProgressFn progress) = 0;
};
}  // namespace wt

#endif  // __WT_REMOTE_EXEC__
