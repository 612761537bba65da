#include "UploadInjector.hpp"

namespace wt {
FileByteSource::FileByteSource(const string& path)
    : stream(path, std::ios::in | std::ios::binary), fileSize(-1) {
  if (!stream.is_open()) {
    throw std::runtime_error("Cannot open " + path);
  }
  std::error_code ec;
  auto s = fs::file_size(path, ec);
  if (!ec) {
    fileSize = int64_t(s);
  }
}

size_t FileByteSource::read(char* buf, size_t count) {
  stream.read(buf, count);
  if (stream.bad()) {
    throw std::runtime_error("Error reading upload source");
  }
  return size_t(stream.gcount());
}

size_t StringByteSource::read(char* buf, size_t count) {
  size_t n = min(count, data.size() - offset);
  memcpy(buf, data.data() + offset, n);
  offset += n;
  return n;
}

UploadTask::UploadTask(const TargetRef& _target, const string& _userIdentity,
                       const string& _fileName, shared_ptr<ByteSource> _source)
    : target(_target),
      userIdentity(_userIdentity),
      fileName(_fileName),
      source(_source),
      cancelled(false),
      progress(0.0) {}

double UploadTask::getProgress() {
  lock_guard<std::mutex> guard(taskMutex);
  return progress;
}

UploadResult UploadTask::getResult() {
  lock_guard<std::mutex> guard(taskMutex);
  return result;
}

void UploadTask::setProgressCallback(ProgressCallback callback) {
  lock_guard<std::mutex> guard(taskMutex);
  progressCallback = callback;
}

void UploadTask::reportProgress(double fraction) {
  ProgressCallback callback;
  {
    lock_guard<std::mutex> guard(taskMutex);
    fraction = max(0.0, min(1.0, fraction));
    if (fraction <= progress && !(fraction == 0.0 && progress == 0.0)) {
      return;
    }
    progress = fraction;
    callback = progressCallback;
  }
  if (callback) {
    callback(fraction);
  }
}

void UploadTask::finish(const UploadResult& finalResult) {
  lock_guard<std::mutex> guard(taskMutex);
  result = finalResult;
}

UploadInjector::UploadInjector(shared_ptr<BulkTransfer> _bulkTransfer,
                               const string& _destinationDirectory,
                               NudgeFn _nudge)
    : bulkTransfer(_bulkTransfer),
      destinationDirectory(_destinationDirectory),
      nudge(_nudge) {
  while (destinationDirectory.size() > 1 &&
         destinationDirectory.back() == '/') {
    destinationDirectory.pop_back();
  }
}

string UploadInjector::sanitizeFileName(const string& fileName) {
  if (fileName.empty()) {
    throw UploadValidationFailed("File name is empty");
  }
  if (fileName.size() > 255) {
    throw UploadValidationFailed("File name is too long");
  }
  if (fileName.find('/') != string::npos ||
      fileName.find('\\') != string::npos) {
    throw UploadValidationFailed("File name must not contain path separators");
  }
  if (fileName.find("..") != string::npos || fileName == ".") {
    throw UploadValidationFailed(
        "File name must not contain traversal sequences");
  }
  for (char c : fileName) {
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
      throw UploadValidationFailed(
          "File name must not contain control characters");
    }
  }
  return fileName;
}

string UploadInjector::destinationPath(const string& sanitizedName) const {
  if (destinationDirectory == "/") {
    return "/" + sanitizedName;
  }
  return destinationDirectory + "/" + sanitizedName;
}

shared_ptr<UploadTask> UploadInjector::createTask(
    const TargetRef& target, const string& userIdentity,
    const string& fileName, shared_ptr<ByteSource> source) {
  return make_shared<UploadTask>(target, userIdentity, fileName, source);
}

UploadResult UploadInjector::run(shared_ptr<UploadTask> task) {
  UploadResult result;
  string sanitizedName;
  try {
    sanitizedName = sanitizeFileName(task->getFileName());
  } catch (const UploadValidationFailed& uvf) {
    LOG(WARNING) << "Rejected upload '" << task->getFileName()
                 << "': " << uvf.what();
    result.kind = UploadResult::VALIDATION_FAILED;
    result.reason = uvf.what();
    task->finish(result);
    return result;
  }

  string path = destinationPath(sanitizedName);
  int64_t totalBytes = task->getSource()->size();
  LOG(INFO) << "Uploading " << sanitizedName << " (" << totalBytes
            << " bytes) to " << task->getTarget() << ":" << path;
  task->reportProgress(0.0);
  try {
    if (task->isCancelled()) {
      throw UploadTransportFailed("Upload cancelled");
    }
    bulkTransfer->put(task->getTarget(), path, task->getSource(),
                      [task, totalBytes](int64_t bytesSent) {
                        if (totalBytes > 0) {
                          task->reportProgress(double(bytesSent) /
                                               double(totalBytes));
                        }
                        return !task->isCancelled();
                      });
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Upload of " << sanitizedName << " to "
                 << task->getTarget() << " failed: " << re.what();
    result.kind = UploadResult::TRANSPORT_FAILED;
    result.reason = re.what();
    task->finish(result);
    return result;
  }

  task->reportProgress(1.0);
  result.kind = UploadResult::SUCCESS;
  result.path = path;
  task->finish(result);
  LOG(INFO) << "Upload complete: " << path;

  if (nudge) {
    try {
      nudge(task->getTarget(), task->getUserIdentity());
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Could not nudge session after upload: " << ex.what();
    }
  }
  return result;
}

shared_ptr<UploadTask> UploadInjector::upload(
    const TargetRef& target, const string& userIdentity,
    const string& fileName, shared_ptr<ByteSource> source,
    UploadTask::ProgressCallback progress) {
  auto task = createTask(target, userIdentity, fileName, source);
  if (progress) {
    task->setProgressCallback(progress);
  }
  run(task);
  return task;
}
}  // namespace wt
