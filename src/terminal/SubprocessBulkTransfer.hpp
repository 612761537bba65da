#ifndef __WT_SUBPROCESS_BULK_TRANSFER__
#define __WT_SUBPROCESS_BULK_TRANSFER__

#include "Headers.hpp"
#include "RemoteExec.hpp"
#include "SubprocessUtils.hpp"

namespace wt {
/**
 * @brief BulkTransfer that pipes the source into a receiving script run on
 * the target (through `kubectl exec -i` in production).
 *
 * The script writes `<dest>.partial` and renames it over `<dest>` only after
 * the stream ended cleanly with the announced byte count, so an aborted
 * upload never replaces the current file.
 */
class SubprocessBulkTransfer : public BulkTransfer {
 public:
  /** @brief Wraps a command so that it runs on `target`. */
  typedef function<vector<string>(const TargetRef& target,
                                  const vector<string>& remoteCommand)>
      CommandWrapper;

  static const size_t CHUNK_SIZE = 4096;

  explicit SubprocessBulkTransfer(CommandWrapper _wrapper,
                                  shared_ptr<SubprocessUtils> _subprocessUtils =
                                      make_shared<SubprocessUtils>());

  virtual ~SubprocessBulkTransfer() {}

  virtual void put(const TargetRef& target, const string& destPath,
                   ByteSource* source, ProgressFn progress);

  /**
   * @brief Remote command that stores stdin at `destPath`.  When
   * `expectedBytes` is not negative a short stream is discarded.
   */
  static vector<string> receiveCommand(const string& destPath,
                                       int64_t expectedBytes = -1);

  /** @brief Remote command that removes the partial file. */
  static vector<string> cleanupCommand(const string& destPath);

 protected:
  void cleanup(const TargetRef& target, const string& destPath);

  CommandWrapper wrapper;
  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace wt

#endif  // __WT_SUBPROCESS_BULK_TRANSFER__
