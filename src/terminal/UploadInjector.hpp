#ifndef __WT_UPLOAD_INJECTOR__
#define __WT_UPLOAD_INJECTOR__

#include "Headers.hpp"
#include "RemoteExec.hpp"

namespace wt {
/**
 * @brief Streams a local file without loading it into memory.
 */
class FileByteSource : public ByteSource {
 public:
  /** @throws std::runtime_error if the file cannot be opened. */
  explicit FileByteSource(const string& path);

  virtual size_t read(char* buf, size_t count);

  virtual int64_t size() { return fileSize; }

 protected:
  std::ifstream stream;
  int64_t fileSize;
};

class StringByteSource : public ByteSource {
 public:
  explicit StringByteSource(const string& _data) : data(_data), offset(0) {}

  virtual size_t read(char* buf, size_t count);

  virtual int64_t size() { return int64_t(data.size()); }

 protected:
  string data;
  size_t offset;
};

struct UploadResult {
  enum Kind { PENDING, SUCCESS, VALIDATION_FAILED, TRANSPORT_FAILED };

  Kind kind = PENDING;
  /** @brief Full remote path, set on success. */
  string path;
  /** @brief Human readable cause, set on failure. */
  string reason;

  bool succeeded() const { return kind == SUCCESS; }
};

/**
 * @brief One file delivery: source, destination, progress and outcome.
 *
 * cancel() may be called from any thread while the upload runs.
 */
class UploadTask {
 public:
  typedef function<void(double fraction)> ProgressCallback;

  UploadTask(const TargetRef& _target, const string& _userIdentity,
             const string& _fileName, shared_ptr<ByteSource> _source);

  void cancel() { cancelled = true; }

  bool isCancelled() const { return cancelled; }

  /** @brief Fraction in [0,1].  Never decreases. */
  double getProgress();

  UploadResult getResult();

  void setProgressCallback(ProgressCallback callback);

  const TargetRef& getTarget() const { return target; }

  const string& getUserIdentity() const { return userIdentity; }

  const string& getFileName() const { return fileName; }

  ByteSource* getSource() { return source.get(); }

 protected:
  friend class UploadInjector;

  void reportProgress(double fraction);

  void finish(const UploadResult& finalResult);

  TargetRef target;
  string userIdentity;
  string fileName;
  shared_ptr<ByteSource> source;
  std::atomic<bool> cancelled;
  std::mutex taskMutex;
  double progress;
  UploadResult result;
  ProgressCallback progressCallback;
};

/**
 * @brief Delivers user files into a fixed directory on a target, out of band
 * from the interactive session, then nudges that session.
 */
class UploadInjector {
 public:
  /** @brief Pokes the interactive session(s) of a user on a target. */
  typedef function<void(const TargetRef& target, const string& userIdentity)>
      NudgeFn;

  UploadInjector(shared_ptr<BulkTransfer> _bulkTransfer,
                 const string& _destinationDirectory = DEFAULT_UPLOAD_DIRECTORY,
                 NudgeFn _nudge = NudgeFn());

  /**
   * @brief Returns `fileName` if it is a plain file name.
   * @throws UploadValidationFailed for empty names, path separators,
   * traversal sequences or control characters.
   */
  static string sanitizeFileName(const string& fileName);

  /** @brief The fixed destination directory joined with `sanitizedName`. */
  string destinationPath(const string& sanitizedName) const;

  shared_ptr<UploadTask> createTask(const TargetRef& target,
                                    const string& userIdentity,
                                    const string& fileName,
                                    shared_ptr<ByteSource> source);

  /** @brief Runs `task` to completion on the calling thread. */
  UploadResult run(shared_ptr<UploadTask> task);

  /** @brief createTask() followed by run(). */
  shared_ptr<UploadTask> upload(const TargetRef& target,
                                const string& userIdentity,
                                const string& fileName,
                                shared_ptr<ByteSource> source,
                                UploadTask::ProgressCallback progress =
                                    UploadTask::ProgressCallback());

  const string& getDestinationDirectory() const {
    return destinationDirectory;
  }

 protected:
  shared_ptr<BulkTransfer> bulkTransfer;
  string destinationDirectory;
  NudgeFn nudge;
};
}  // namespace wt

#endif  // __WT_UPLOAD_INJECTOR__
