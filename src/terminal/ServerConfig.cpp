#include "ServerConfig.hpp"

namespace wt {
namespace {
int getInt(const CSimpleIniA& ini, const char* section, const char* key,
           int defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    return stoi(value);
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for ") + section + "." +
                             key + ": " + value);
  }
}

void getString(const CSimpleIniA& ini, const char* section, const char* key,
               string* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = string(value);
  }
}
}  // namespace

ServerConfig ServerConfig::load(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  return fromIni(ini);
}

ServerConfig ServerConfig::parse(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  return fromIni(ini);
}

ServerConfig ServerConfig::fromIni(const CSimpleIniA& ini) {
  ServerConfig config;
  config.port = getInt(ini, "Networking", "port", config.port);
  getString(ini, "Networking", "bind_ip", &config.bindIp);

  getString(ini, "Kubernetes", "kubectl", &config.kubectl.kubectlPath);
  getString(ini, "Kubernetes", "kubeconfig", &config.kubectl.kubeconfig);
  getString(ini, "Kubernetes", "context", &config.kubectl.context);
  getString(ini, "Kubernetes", "shell", &config.kubectl.shell);

  config.idleTimeoutSeconds =
      getInt(ini, "Session", "idle_timeout", config.idleTimeoutSeconds);
  config.connectionTimeoutSeconds = getInt(
      ini, "Session", "connection_timeout", config.connectionTimeoutSeconds);

  getString(ini, "Upload", "directory", &config.uploadDirectory);
  const char* maxSize = ini.GetValue("Upload", "max_size", NULL);
  if (maxSize) {
    try {
      config.uploadMaxSize = stoll(maxSize);
    } catch (const std::logic_error&) {
      throw std::runtime_error(string("Invalid Upload.max_size: ") + maxSize);
    }
  }

  config.cacheTtlSeconds = getInt(ini, "Cache", "ttl", config.cacheTtlSeconds);

  config.verbose = getInt(ini, "Debug", "verbose", config.verbose);
  config.silent = getInt(ini, "Debug", "silent", 0) != 0;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config.logsize = string(logsize);
  }
  getString(ini, "Debug", "logdir", &config.logdir);

  if (config.port <= 0 || config.port > 65535) {
    throw std::runtime_error("Invalid port: " + to_string(config.port));
  }
  return config;
}
}  // namespace wt
