#include "core/resources/GitHubPages.hpp"
#include "core/resources/LocalDir.hpp"
#include "core/resources/RemoteBucket.hpp"
#include "core/resources/ResourceProvider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace webres {
namespace {

void expectDerivedUrlsFollowRoot(const ResourceProvider& p) {
    EXPECT_EQ(p.appWasm(), p.staticResources() + "/web/app.wasm");
    EXPECT_EQ(p.robotsTxt(), p.staticResources() + "/web/robots.txt");
    EXPECT_EQ(p.adsTxt(), p.staticResources() + "/web/ads.txt");
}

}  // namespace

TEST(ResourceProviderTest, DerivedUrlsFollowStaticRootForEveryBackend) {
    const std::vector<std::string> configs = {
        "", "web", "/srv/app/web/", "https://cdn.example.com/assets/", "my-repo", "/my-repo",
    };
    for (const auto& c : configs) {
        SCOPED_TRACE(c);
        expectDerivedUrlsFollowRoot(*localDir(c));
        expectDerivedUrlsFollowRoot(*remoteBucket(c));
        expectDerivedUrlsFollowRoot(*gitHubPages(c));
    }
}

TEST(ResourceProviderTest, WebUrlJoinsRootPrefixAndFile) {
    EXPECT_EQ(webUrl("", kAppWasm), "/web/app.wasm");
    EXPECT_EQ(webUrl("/repo", kRobotsTxt), "/repo/web/robots.txt");
    EXPECT_EQ(webUrl("https://x.io", kAdsTxt), "https://x.io/web/ads.txt");
}

TEST(LocalDirTest, ResourcesAreRootedRegardlessOfDirectory) {
    for (const char* dir : {"web", "/var/www/static", ""}) {
        SCOPED_TRACE(dir);
        auto p = localDir(dir);
        EXPECT_EQ(p->appResources(), "");
        EXPECT_EQ(p->staticResources(), "");
        EXPECT_EQ(p->appWasm(), "/web/app.wasm");
        EXPECT_EQ(p->robotsTxt(), "/web/robots.txt");
        EXPECT_EQ(p->adsTxt(), "/web/ads.txt");
    }
}

TEST(LocalDirTest, ExposesStaticHandlerForConfiguredDirectory) {
    LocalDir p("/srv/web");
    ASSERT_NE(p.staticHandler(), nullptr);
    EXPECT_EQ(p.staticHandler()->root(), "/srv/web");
    EXPECT_EQ(p.path(), "/srv/web");
    EXPECT_FALSE(p.staticSiteOnly());
    EXPECT_STREQ(p.kind(), "local");
}

TEST(RemoteBucketTest, NormalizesTrailingSlashAndWebSegment) {
    for (const char* url : {"https://cdn.example.com/assets/",
                            "https://cdn.example.com/assets",
                            "https://cdn.example.com/assets/web",
                            "https://cdn.example.com/assets/web/"}) {
        SCOPED_TRACE(url);
        RemoteBucket b(url);
        EXPECT_EQ(b.staticResources(), "https://cdn.example.com/assets");
        EXPECT_EQ(b.appWasm(), "https://cdn.example.com/assets/web/app.wasm");
    }
}

TEST(RemoteBucketTest, KeepsSegmentsThatOnlyEndInWeb) {
    RemoteBucket b("https://cdn.example.com/myweb");
    EXPECT_EQ(b.staticResources(), "https://cdn.example.com/myweb");
}

TEST(RemoteBucketTest, AppResourcesAreEmptyAndNothingIsServed) {
    auto b = remoteBucket("https://storage.googleapis.com/bucket");
    EXPECT_EQ(b->appResources(), "");
    EXPECT_EQ(b->staticHandler(), nullptr);
    EXPECT_FALSE(b->staticSiteOnly());
    EXPECT_STREQ(b->kind(), "bucket");
}

TEST(RemoteBucketTest, RobotsTxtFromWebSubpath) {
    auto b = remoteBucket("https://s3.example.com/myapp/web");
    EXPECT_EQ(b->robotsTxt(), "https://s3.example.com/myapp/web/robots.txt");
    EXPECT_EQ(b->adsTxt(), "https://s3.example.com/myapp/web/ads.txt");
}

TEST(GitHubPagesTest, PrependsSlashToRepoName) {
    for (const char* repo : {"my-repo", "/my-repo"}) {
        SCOPED_TRACE(repo);
        GitHubPages g(repo);
        EXPECT_EQ(g.appResources(), "/my-repo");
        EXPECT_EQ(g.staticResources(), "/my-repo");
        EXPECT_EQ(g.appWasm(), "/my-repo/web/app.wasm");
        EXPECT_EQ(g.robotsTxt(), "/my-repo/web/robots.txt");
        EXPECT_EQ(g.adsTxt(), "/my-repo/web/ads.txt");
    }
}

TEST(GitHubPagesTest, IsStaticSiteOnly) {
    auto g = gitHubPages("site");
    EXPECT_TRUE(g->staticSiteOnly());
    EXPECT_EQ(g->staticHandler(), nullptr);
    EXPECT_STREQ(g->kind(), "pages");
}

}  // namespace webres
