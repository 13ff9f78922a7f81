#pragma once
#include <functional>
#include <memory>
#include <string>

namespace webres {

class ResourceProvider;

struct Config {
  std::string provider = "local";   // local | bucket | pages
  std::string webDir = "web";
  std::string bucketUrl;
  std::string repo;
  std::string host = "0.0.0.0";
  int port = 8080;
  std::string logLevel = "info";
};

// Returns the value for key, or defval when unset.
using EnvLookup = std::function<std::string(const char* key, const std::string& defval)>;

std::string get_env_or(const char* key, const std::string& defval);

// Reads WEBRES_* variables through lookup. Never throws; bad ports fall back
// to 8080 with a warning.
Config loadConfig(const EnvLookup& lookup);

inline Config loadConfigFromEnv() { return loadConfig(get_env_or); }

// Builds the provider selected by cfg.provider.
// Throws std::invalid_argument for an unknown provider or a missing value.
std::unique_ptr<ResourceProvider> makeProvider(const Config& cfg);

} // namespace webres
