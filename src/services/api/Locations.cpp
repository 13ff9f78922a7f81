#include "Locations.hpp"

#include "core/resources/ResourceProvider.hpp"

namespace webres {

nlohmann::json describeProvider(const ResourceProvider& provider) {
  return {
    {"provider",         provider.kind()},
    {"app_resources",    provider.appResources()},
    {"static_resources", provider.staticResources()},
    {"app_wasm",         provider.appWasm()},
    {"robots_txt",       provider.robotsTxt()},
    {"ads_txt",          provider.adsTxt()},
    {"serves_static",    provider.staticHandler() != nullptr},
    {"static_site_only", provider.staticSiteOnly()}
  };
}

} // namespace webres
