#include <cxxopts.hpp>

#include "KubectlCommands.hpp"
#include "LogAuditSink.hpp"
#include "LogHandler.hpp"
#include "PseudoTerminalTransport.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"
#include "SubprocessBulkTransfer.hpp"
#include "TargetExistenceCache.hpp"
#include "UploadInjector.hpp"
#include "WebTerminalServer.hpp"

using namespace wt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  wt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, wt::InterruptSignalHandler);
  // A browser going away mid write must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("wtserver",
                           "Browser terminals for Kubernetes workloads");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on", cxxopts::value<int>())       //
        ("bindip", "IP to listen on", cxxopts::value<string>())    //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("kubectl", "Path to the kubectl binary",
         cxxopts::value<string>())  //
        ("kubeconfig", "kubeconfig file passed to kubectl",
         cxxopts::value<string>())  //
        ("context", "kubeconfig context", cxxopts::value<string>())  //
        ("shell", "Shell started inside the pod",
         cxxopts::value<string>())  //
        ("uploaddir", "Directory uploads are written to inside the pod",
         cxxopts::value<string>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wtserver version " << WT_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        config = ServerConfig::load(cfgfilename);
      } catch (const std::runtime_error &re) {
        STFATAL << re.what();
      }
    }

    // Command line wins over the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("kubectl")) {
      config.kubectl.kubectlPath = result["kubectl"].as<string>();
    }
    if (result.count("kubeconfig")) {
      config.kubectl.kubeconfig = result["kubeconfig"].as<string>();
    }
    if (result.count("context")) {
      config.kubectl.context = result["context"].as<string>();
    }
    if (result.count("shell")) {
      config.kubectl.shell = result["shell"].as<string>();
    }
    if (result.count("uploaddir")) {
      config.uploadDirectory = result["uploaddir"].as<string>();
    }
    if (result.count("logdir")) {
      config.logdir = result["logdir"].as<string>();
    }
    if (config.logdir.empty()) {
      config.logdir = GetTempDirectory();
    }
    if (result.count("verbose") && result["verbose"].as<int>() > 0) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFiles(&defaultConf, config.logdir, "wtserver",
                              logToStdout, !logToStdout, false,
                              config.logsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setupAuditLogger(config.logdir, "wtserver", logToStdout);
    // set thread name
    el::Helpers::setThreadName("wtserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto clock = make_shared<SystemClock>();
    auto subprocessUtils = make_shared<SubprocessUtils>();
    KubectlCommands commands(config.kubectl);
    auto discovery = make_shared<KubectlDiscovery>(subprocessUtils, commands);
    if (!discovery->isAvailable()) {
      LOG(WARNING) << "kubectl not found at '" << config.kubectl.kubectlPath
                   << "', every target will look missing";
    }
    auto existenceCache = make_shared<TargetExistenceCache>(
        discovery, clock, std::chrono::seconds(config.cacheTtlSeconds));
    auto executor = make_shared<PseudoTerminalExecutor>(
        [commands](const TargetRef &target) {
          return commands.interactiveShell(target);
        },
        existenceCache);
    auto registry = make_shared<SessionRegistry>();
    auto bulkTransfer = make_shared<SubprocessBulkTransfer>(
        [commands](const TargetRef &target,
                   const vector<string> &remoteCommand) {
          return commands.streamingExec(target, remoteCommand);
        },
        subprocessUtils);
    auto uploadInjector = make_shared<UploadInjector>(
        bulkTransfer, config.uploadDirectory,
        [registry](const TargetRef &target, const string &userIdentity) {
          registry->nudge(target, userIdentity);
        });

    BridgeConfig bridgeConfig;
    bridgeConfig.idleTimeoutSeconds = config.idleTimeoutSeconds;
    bridgeConfig.connectionTimeoutSeconds = config.connectionTimeoutSeconds;

    SocketEndpoint serverEndpoint;
    serverEndpoint.set_name(config.bindIp);
    serverEndpoint.set_port(config.port);
    LOG(INFO) << "Starting wtserver " << WT_VERSION << " on "
              << serverEndpoint;
    WebTerminalServer server(serverEndpoint, executor, existenceCache,
                             uploadInjector, make_shared<LogAuditSink>(),
                             registry, clock, bridgeConfig,
                             config.uploadMaxSize);
    server.setHealthProbe([discovery] { return discovery->isAvailable(); });
    server.run();
  } catch (cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
