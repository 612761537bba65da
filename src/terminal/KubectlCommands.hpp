#ifndef __WT_KUBECTL_COMMANDS__
#define __WT_KUBECTL_COMMANDS__

#include "Headers.hpp"
#include "RemoteExec.hpp"
#include "SubprocessUtils.hpp"

namespace wt {
struct KubectlConfig {
  string kubectlPath = "kubectl";
  /** @brief Optional --kubeconfig file. */
  string kubeconfig;
  /** @brief Optional --context name. */
  string context;
  /** @brief Shell started inside the target. */
  string shell = "/bin/bash";
};

/**
 * @brief Builds kubectl argument vectors.  Never goes through a shell.
 */
class KubectlCommands {
 public:
  explicit KubectlCommands(const KubectlConfig& _config) : config(_config) {}

  /**
   * @brief True for DNS-1123 style names: lowercase alphanumerics, '-' and
   * '.', starting and ending alphanumeric, at most 253 characters.
   */
  static bool isValidTargetName(const string& name);

  static bool isValidTarget(const TargetRef& target) {
    return isValidTargetName(target.ns()) && isValidTargetName(target.name());
  }

  /** @brief `kubectl exec -i -t` running the configured shell. */
  vector<string> interactiveShell(const TargetRef& target) const;

  /** @brief `kubectl exec -i` running `remoteCommand` without a tty. */
  vector<string> streamingExec(const TargetRef& target,
                               const vector<string>& remoteCommand) const;

  /** @brief `kubectl get pod NAME -n NS -o name`. */
  vector<string> getPod(const TargetRef& target) const;

  const KubectlConfig& getConfig() const { return config; }

 protected:
  vector<string> base() const;

  /** @throws TargetUnreachable for names kubectl could mistake for flags. */
  static void validate(const TargetRef& target);

  KubectlConfig config;
};

/**
 * @brief Target discovery through `kubectl get pod`.
 */
class KubectlDiscovery : public TargetDiscovery {
 public:
  KubectlDiscovery(shared_ptr<SubprocessUtils> _subprocessUtils,
                   const KubectlCommands& _commands)
      : subprocessUtils(_subprocessUtils), commands(_commands) {}

  virtual ~KubectlDiscovery() {}

  virtual bool query(const TargetRef& target);

  virtual bool isWellFormed(const TargetRef& target) {
    return KubectlCommands::isValidTarget(target);
  }

  /**
   * @brief Maps the outcome of `kubectl get pod` to an answer.
   * @throws QueryFailed when the output does not say NotFound.
   */
  static bool interpretGetPod(int exitCode, const string& output);

  /** @brief True if the kubectl binary can be found and executed. */
  bool isAvailable() const;

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  KubectlCommands commands;
};
}  // namespace wt

#endif  // __WT_KUBECTL_COMMANDS__
