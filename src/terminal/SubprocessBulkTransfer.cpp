#include "SubprocessBulkTransfer.hpp"

#include "RawSocketUtils.hpp"

namespace wt {
SubprocessBulkTransfer::SubprocessBulkTransfer(
    CommandWrapper _wrapper, shared_ptr<SubprocessUtils> _subprocessUtils)
    : wrapper(_wrapper), subprocessUtils(_subprocessUtils) {}

vector<string> SubprocessBulkTransfer::receiveCommand(const string& destPath,
                                                      int64_t expectedBytes) {
  string directory = fs::path(destPath).parent_path().string();
  if (directory.empty()) {
    directory = ".";
  }
  return {"sh", "-c",
          "mkdir -p \"$1\" && cat > \"$2.partial\" && "
          "if [ \"$3\" -ge 0 ] && "
          "[ \"$(wc -c < \"$2.partial\")\" -ne \"$3\" ]; then "
          "rm -f \"$2.partial\"; echo \"incomplete upload\" >&2; exit 1; "
          "fi && mv -f \"$2.partial\" \"$2\"",
          "sh", directory, destPath, to_string(expectedBytes)};
}

vector<string> SubprocessBulkTransfer::cleanupCommand(const string& destPath) {
  return {"rm", "-f", destPath + ".partial"};
}

void SubprocessBulkTransfer::put(const TargetRef& target,
                                 const string& destPath, ByteSource* source,
                                 ProgressFn progress) {
  vector<string> argv =
      wrapper(target, receiveCommand(destPath, source->size()));
  ChildProcess child;
  try {
    child = SubprocessUtils::spawn(argv, true);
  } catch (const std::runtime_error& re) {
    throw UploadTransportFailed(re.what());
  }

  string failure;
  bool cancelled = false;
  int64_t bytesSent = 0;
  char buf[CHUNK_SIZE];
  try {
    while (true) {
      size_t n = source->read(buf, sizeof(buf));
      if (n == 0) {
        break;
      }
      RawSocketUtils::writeAll(child.stdinFd, buf, n);
      bytesSent += n;
      if (progress && !progress(bytesSent)) {
        cancelled = true;
        break;
      }
    }
  } catch (const std::runtime_error& re) {
    // A dead receiver shows up here as EPIPE; its output says why.
    failure = re.what();
  }

  if (cancelled) {
    LOG(INFO) << "Upload to " << target << ":" << destPath
              << " cancelled after " << bytesSent << " bytes";
    // Kill before closing stdin so the receiver never sees a clean EOF.
    SubprocessUtils::terminate(child.pid);
    ::close(child.stdinFd);
    SubprocessUtils::drain(child.outputFd);
    cleanup(target, destPath);
    throw UploadTransportFailed("Upload cancelled");
  }

  ::close(child.stdinFd);
  string output = SubprocessUtils::drain(child.outputFd);
  int exitCode = SubprocessUtils::waitForExit(child.pid);
  if (exitCode != 0 || !failure.empty()) {
    cleanup(target, destPath);
    string reason = "File transfer failed";
    if (exitCode != 0) {
      reason += " (exit code " + to_string(exitCode) + ")";
    }
    while (!output.empty() && isspace((unsigned char)output.back())) {
      output.pop_back();
    }
    if (!output.empty()) {
      reason += ": " + output;
    } else if (!failure.empty()) {
      reason += ": " + failure;
    }
    throw UploadTransportFailed(reason);
  }
  VLOG(1) << "Transferred " << bytesSent << " bytes to " << destPath;
}

void SubprocessBulkTransfer::cleanup(const TargetRef& target,
                                     const string& destPath) {
  vector<string> argv = wrapper(target, cleanupCommand(destPath));
  string output;
  try {
    int exitCode = subprocessUtils->runToString(
        argv[0], vector<string>(argv.begin() + 1, argv.end()), &output);
    if (exitCode != 0) {
      LOG(WARNING) << "Could not remove partial upload " << destPath
                   << ".partial: " << output;
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not remove partial upload: " << re.what();
  }
}
}  // namespace wt
