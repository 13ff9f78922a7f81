#pragma once
#include <string>

namespace httplib {
class Server;
}

namespace webres {

class ResourceProvider;

struct ServerOptions {
  std::string host = "0.0.0.0";
  int port = 8080;
};

// Registers the routes on svr: the static handler (when the provider has one)
// as a pre-routing hook, GET /health and GET /web.json.
// Throws std::logic_error when provider.staticSiteOnly().
void configure_http_server(httplib::Server& svr, const ResourceProvider& provider);

// Start a blocking HTTP server. Throws std::runtime_error if the port cannot
// be bound.
void run_http_server(const ResourceProvider& provider, const ServerOptions& options);

} // namespace webres
