#pragma once
#include <nlohmann/json.hpp>

namespace webres {

class ResourceProvider;

// Where the page renderer should point generated markup:
// {"provider","app_resources","static_resources","app_wasm","robots_txt",
//  "ads_txt","serves_static","static_site_only"}
nlohmann::json describeProvider(const ResourceProvider& provider);

} // namespace webres
