#include <cxxopts.hpp>

#include "BridgeTransport.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "TerminalClient.hpp"
#include "UploadClient.hpp"

using namespace wt;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

// Splits "namespace/podname".
bool parseTargetArg(const string& arg, TargetRef* target) {
  size_t slash = arg.find('/');
  if (slash == string::npos || slash == 0 || slash + 1 == arg.size() ||
      arg.find('/', slash + 1) != string::npos) {
    return false;
  }
  *target = makeTargetRef(arg.substr(0, slash), arg.substr(slash + 1));
  return true;
}

string localUserName() {
  const char* user = getenv("USER");
  if (user && *user) {
    return string(user);
  }
  passwd* pwd = getpwuid(getuid());
  if (pwd && pwd->pw_name) {
    return string(pwd->pw_name);
  }
  return "unknown_user";
}

int runUpload(const SocketEndpoint& serverEndpoint, const TargetRef& target,
              const string& user, const string& localPath) {
  UploadClient uploadClient(serverEndpoint, user);
  int lastPercent = -1;
  try {
    UploadResponse response = uploadClient.upload(
        target, localPath, [&lastPercent](int64_t sent, int64_t total) {
          int percent = total > 0 ? int(sent * 100 / total) : 100;
          if (percent != lastPercent) {
            lastPercent = percent;
            cout << "\rUploading... " << percent << "%" << flush;
          }
        });
    cout << endl;
    if (response.status_code() != 200) {
      CLOG(INFO, "stdout") << "Upload failed (" << response.status_code()
                           << "): " << response.error() << endl;
      return 1;
    }
    CLOG(INFO, "stdout") << "Uploaded to " << response.path() << endl;
    return 0;
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Upload failed: " << re.what() << endl;
    return 1;
  }
}

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  wt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, wt::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  // Parse command line arguments
  cxxopts::Options options("wt", "Browser-style terminal for pods, in a tty");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.custom_help("[OPTION...] namespace/podname");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("target", "namespace/podname to attach to",
         cxxopts::value<std::string>())  //
        ("host", "wtserver host name",
         cxxopts::value<std::string>()->default_value("localhost"))  //
        ("p,port", "wtserver port",
         cxxopts::value<int>()->default_value(to_string(DEFAULT_SERVER_PORT)))  //
        ("u,user", "User name recorded in the audit log",
         cxxopts::value<std::string>())  //
        ("upload", "Upload FILE to the pod and exit",
         cxxopts::value<std::string>())  //
        ("liveness", "Milliseconds of silence before a heartbeat",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_LIVENESS_TIMEOUT_MS)))  //
        ("max-retries", "Reconnect attempts before giving up",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_MAX_RECONNECT_ATTEMPTS)))  //
        ("backoff", "First reconnect delay in milliseconds",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_BACKOFF_BASE_MS)))  //
        ("chunk-threshold", "Pastes larger than this are sent in fragments",
         cxxopts::value<int>()->default_value(
             to_string(DEFAULT_CHUNK_THRESHOLD)))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging");

    options.parse_positional({"target"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wt version " << WT_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    if (result.count("silent")) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "wtclient", result.count("logtostdout"),
                              !result.count("logtostdout"));

    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("client-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (!result.count("target")) {
      CLOG(INFO, "stdout") << "Missing namespace/podname to connect to"
                           << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }
    TargetRef target;
    if (!parseTargetArg(result["target"].as<string>(), &target)) {
      CLOG(INFO, "stdout") << "Invalid target: " << result["target"].as<string>()
                           << " (expected namespace/podname)" << endl;
      exit(1);
    }

    string user =
        result.count("user") ? result["user"].as<string>() : localUserName();
    SocketEndpoint serverEndpoint;
    serverEndpoint.set_name(result["host"].as<string>());
    serverEndpoint.set_port(result["port"].as<int>());

    if (result.count("upload")) {
      exitCode = runUpload(serverEndpoint, target, user,
                           result["upload"].as<string>());
    } else {
      ClientConfig config;
      config.session.livenessTimeoutMs = result["liveness"].as<int>();
      config.session.chunking.threshold = result["chunk-threshold"].as<int>();
      config.reconnect.maxAttempts = result["max-retries"].as<int>();
      config.reconnect.backoffBaseMs = result["backoff"].as<int>();

      auto timers = make_shared<ThreadTimerScheduler>();
      TerminalClient terminalClient(
          make_shared<PseudoTerminalConsole>(),
          make_shared<BridgeExecutor>(serverEndpoint, user), timers,
          make_shared<SystemClock>(), target, user, config);
      exitCode = terminalClient.run();
      timers->shutdown();
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}
