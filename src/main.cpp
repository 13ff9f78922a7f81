// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/resources/ResourceProvider.hpp"
#include "services/api/HttpServer.hpp"
#include "services/api/Locations.hpp"

// ---------- helpers ----------

static void apply_log_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("unknown WEBRES_LOG_LEVEL '{}', using info", name);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve       # start HTTP server (WEBRES_PORT or 8080)\n"
            << "  " << argv0 << " --print       # print resource locations as JSON\n"
            << "\n"
            << "Provider: WEBRES_PROVIDER=local|bucket|pages\n"
            << "  local   WEBRES_WEB_DIR (default: web)\n"
            << "  bucket  WEBRES_BUCKET_URL\n"
            << "  pages   WEBRES_REPO (static websites only)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string mode = argc > 1 ? argv[1] : "";
    if (mode != "--serve" && mode != "--print") {
      print_usage(argv[0]);
      return 1;
    }

    const webres::Config cfg = webres::loadConfigFromEnv();
    apply_log_level(cfg.logLevel);
    const auto provider = webres::makeProvider(cfg);

    if (mode == "--print") {
      std::cout << webres::describeProvider(*provider).dump(2) << "\n";
      return 0;
    }

    webres::ServerOptions options;
    options.host = cfg.host;
    options.port = cfg.port;
    webres::run_http_server(*provider, options);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
