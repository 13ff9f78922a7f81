#include "Config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

#include "core/resources/ResourceProvider.hpp"

namespace webres {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int parse_port(const std::string& s, int defval) {
  int port = 0;
  size_t used = 0;
  try {
    port = std::stoi(s, &used);
  } catch (const std::exception& e) {
    spdlog::warn("invalid WEBRES_PORT '{}' ({}), using {}", s, e.what(), defval);
    return defval;
  }
  if (used != s.size() || port <= 0 || port > 65535) {
    spdlog::warn("invalid WEBRES_PORT '{}', using {}", s, defval);
    return defval;
  }
  return port;
}

Config loadConfig(const EnvLookup& lookup) {
  Config cfg;
  cfg.provider  = lookup("WEBRES_PROVIDER", cfg.provider);
  cfg.webDir    = lookup("WEBRES_WEB_DIR", cfg.webDir);
  cfg.bucketUrl = lookup("WEBRES_BUCKET_URL", cfg.bucketUrl);
  cfg.repo      = lookup("WEBRES_REPO", cfg.repo);
  cfg.host      = lookup("WEBRES_HOST", cfg.host);
  cfg.port      = parse_port(lookup("WEBRES_PORT", std::to_string(cfg.port)), cfg.port);
  cfg.logLevel  = lookup("WEBRES_LOG_LEVEL", cfg.logLevel);
  return cfg;
}

std::unique_ptr<ResourceProvider> makeProvider(const Config& cfg) {
  if (cfg.provider == "local") {
    if (cfg.webDir.empty()) throw std::invalid_argument("WEBRES_WEB_DIR must not be empty");
    return localDir(cfg.webDir);
  }
  if (cfg.provider == "bucket") {
    if (cfg.bucketUrl.empty()) throw std::invalid_argument("WEBRES_BUCKET_URL required for provider 'bucket'");
    return remoteBucket(cfg.bucketUrl);
  }
  if (cfg.provider == "pages") {
    if (cfg.repo.empty()) throw std::invalid_argument("WEBRES_REPO required for provider 'pages'");
    return gitHubPages(cfg.repo);
  }
  throw std::invalid_argument("unknown provider '" + cfg.provider + "' (expected local, bucket or pages)");
}

} // namespace webres
