#include "KubectlCommands.hpp"

namespace wt {
bool KubectlCommands::isValidTargetName(const string& name) {
  if (name.empty() || name.size() > 253) {
    return false;
  }
  auto isAlnum = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
  };
  if (!isAlnum(name.front()) || !isAlnum(name.back())) {
    return false;
  }
  for (char c : name) {
    if (!isAlnum(c) && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

void KubectlCommands::validate(const TargetRef& target) {
  if (!isValidTarget(target)) {
    throw TargetUnreachable("Invalid target name: " + targetKey(target));
  }
}

vector<string> KubectlCommands::base() const {
  vector<string> argv = {config.kubectlPath};
  if (!config.kubeconfig.empty()) {
    argv.push_back("--kubeconfig");
    argv.push_back(config.kubeconfig);
  }
  if (!config.context.empty()) {
    argv.push_back("--context");
    argv.push_back(config.context);
  }
  return argv;
}

vector<string> KubectlCommands::interactiveShell(
    const TargetRef& target) const {
  validate(target);
  vector<string> argv = base();
  argv.insert(argv.end(), {"exec", "-i", "-t", "-n", target.ns(),
                           target.name(), "--", config.shell});
  return argv;
}

vector<string> KubectlCommands::streamingExec(
    const TargetRef& target, const vector<string>& remoteCommand) const {
  validate(target);
  vector<string> argv = base();
  argv.insert(argv.end(),
              {"exec", "-i", "-n", target.ns(), target.name(), "--"});
  argv.insert(argv.end(), remoteCommand.begin(), remoteCommand.end());
  return argv;
}

vector<string> KubectlCommands::getPod(const TargetRef& target) const {
  validate(target);
  vector<string> argv = base();
  argv.insert(argv.end(),
              {"get", "pod", target.name(), "-n", target.ns(), "-o", "name"});
  return argv;
}

bool KubectlDiscovery::query(const TargetRef& target) {
  if (!KubectlCommands::isValidTarget(target)) {
    return false;
  }
  vector<string> argv = commands.getPod(target);
  string output;
  int exitCode;
  try {
    exitCode = subprocessUtils->runToString(
        argv[0], vector<string>(argv.begin() + 1, argv.end()), &output);
  } catch (const std::runtime_error& re) {
    throw QueryFailed(re.what());
  }
  return interpretGetPod(exitCode, output);
}

bool KubectlDiscovery::interpretGetPod(int exitCode, const string& output) {
  if (exitCode == 0) {
    return true;
  }
  if (output.find("NotFound") != string::npos ||
      output.find("not found") != string::npos) {
    return false;
  }
  throw QueryFailed("kubectl get pod exited with " + to_string(exitCode) +
                    ": " + output);
}

bool KubectlDiscovery::isAvailable() const {
  const string& kubectl = commands.getConfig().kubectlPath;
  if (kubectl.find('/') != string::npos) {
    return ::access(kubectl.c_str(), X_OK) == 0;
  }
  const char* path = ::getenv("PATH");
  if (!path) {
    return false;
  }
  for (const auto& dir : split(path, ':')) {
    if (!dir.empty() && ::access((dir + "/" + kubectl).c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace wt
