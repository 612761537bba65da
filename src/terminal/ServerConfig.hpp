#ifndef __WT_SERVER_CONFIG__
#define __WT_SERVER_CONFIG__

#include "Headers.hpp"
#include "KubectlCommands.hpp"
#include "SimpleIni.h"

namespace wt {
/**
 * @brief Settings for wtserver, read from an INI file.  Anything missing
 * keeps its default.
 */
struct ServerConfig {
  int port = DEFAULT_SERVER_PORT;
  string bindIp = "0.0.0.0";

  KubectlConfig kubectl;

  int idleTimeoutSeconds = DEFAULT_IDLE_TIMEOUT_SECONDS;
  int connectionTimeoutSeconds = DEFAULT_CONNECTION_TIMEOUT_SECONDS;

  string uploadDirectory = DEFAULT_UPLOAD_DIRECTORY;
  /** @brief Largest accepted upload body in bytes. */
  int64_t uploadMaxSize = 100 * 1024 * 1024;

  int cacheTtlSeconds = DEFAULT_TARGET_CACHE_TTL_SECONDS;

  int verbose = 0;
  bool silent = false;
  string logsize = "20971520";
  string logdir;

  /** @throws std::runtime_error if the file cannot be parsed. */
  static ServerConfig load(const string& path);

  /** @throws std::runtime_error if `data` is not valid INI. */
  static ServerConfig parse(const string& data);

  static ServerConfig fromIni(const CSimpleIniA& ini);
};
}  // namespace wt

#endif  // __WT_SERVER_CONFIG__
