#include "services/api/Locations.hpp"
#include "core/resources/ResourceProvider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace webres {

TEST(LocationsTest, DescribesRemoteBucket) {
    const auto doc = describeProvider(*remoteBucket("https://s3.example.com/myapp/web"));
    const nlohmann::json expected = {
        {"provider", "bucket"},
        {"app_resources", ""},
        {"static_resources", "https://s3.example.com/myapp"},
        {"app_wasm", "https://s3.example.com/myapp/web/app.wasm"},
        {"robots_txt", "https://s3.example.com/myapp/web/robots.txt"},
        {"ads_txt", "https://s3.example.com/myapp/web/ads.txt"},
        {"serves_static", false},
        {"static_site_only", false},
    };
    EXPECT_EQ(doc, expected);
}

TEST(LocationsTest, DescribesLocalDir) {
    const auto doc = describeProvider(*localDir("web"));
    EXPECT_EQ(doc["provider"], "local");
    EXPECT_EQ(doc["static_resources"], "");
    EXPECT_EQ(doc["app_wasm"], "/web/app.wasm");
    EXPECT_EQ(doc["serves_static"], true);
}

TEST(LocationsTest, DescribesGitHubPages) {
    const auto doc = describeProvider(*gitHubPages("my-repo"));
    EXPECT_EQ(doc["app_resources"], "/my-repo");
    EXPECT_EQ(doc["ads_txt"], "/my-repo/web/ads.txt");
    EXPECT_EQ(doc["static_site_only"], true);
}

}  // namespace webres
