#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

#include "Locations.hpp"
#include "core/resources/ResourceProvider.hpp"
#include "core/resources/StaticFileHandler.hpp"

namespace webres {

void configure_http_server(httplib::Server& svr, const ResourceProvider& provider) {
  if (provider.staticSiteOnly()) {
    throw std::logic_error(std::string("provider '") + provider.kind() +
                           "' only supports pre-rendered static websites");
  }

  // Static resources: "/web/..." goes to the provider's handler before routing.
  if (const StaticFileHandler* handler = provider.staticHandler()) {
    svr.set_pre_routing_handler([handler](const httplib::Request& req, httplib::Response& res) {
      return handler->handle(req, res) ? httplib::Server::HandlerResponse::Handled
                                       : httplib::Server::HandlerResponse::Unhandled;
    });
  }

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // Resource locations for the page renderer.
  svr.Get("/web.json", [&provider](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content(describeProvider(provider).dump(), "application/json");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });
}

void run_http_server(const ResourceProvider& provider, const ServerOptions& options) {
  httplib::Server svr;
  configure_http_server(svr, provider);

  spdlog::info("serving provider '{}' (app resources '{}', static resources '{}')",
               provider.kind(), provider.appResources(), provider.staticResources());
  spdlog::info("HTTP server listening on http://{}:{}", options.host, options.port);
  if (!svr.listen(options.host, options.port)) {
    spdlog::error("Failed to bind port {}", options.port);
    throw std::runtime_error("failed to bind " + options.host + ":" + std::to_string(options.port));
  }
}

} // namespace webres
