#pragma once
#include <memory>
#include <string>

namespace webres {

class StaticFileHandler;

// Fixed URL conventions shared by every provider. Static resources always live
// under kWebPrefix so they never collide with app resources served from root.
inline constexpr const char* kWebPrefix = "/web";
inline constexpr const char* kAppWasm   = "app.wasm";
inline constexpr const char* kRobotsTxt = "robots.txt";
inline constexpr const char* kAdsTxt    = "ads.txt";

// root + "/web/" + file
std::string webUrl(const std::string& root, const char* file);

// Describes where app resources and static resources are located.
//
// App resources are the files the runtime requires at fixed root-relative
// paths (e.g. "/app-worker.js", "/manifest.webmanifest", "/wasm_exec.js").
// Static resources are application assets (wasm binary, styles, images) and
// are always addressed under "/web" (e.g. "/web/app.wasm", "/web/main.css").
//
// Implementations are immutable after construction and safe to share across
// threads without locking.
class ResourceProvider {
public:
  virtual ~ResourceProvider() = default;

  // Root path under which app resources are reachable. Empty means "/".
  virtual std::string appResources() const = 0;

  // Path or URL of the location holding the "web" directory.
  virtual std::string staticResources() const = 0;

  // StaticResources/web/app.wasm
  std::string appWasm() const { return webUrl(staticResources(), kAppWasm); }

  // StaticResources/web/robots.txt
  std::string robotsTxt() const { return webUrl(staticResources(), kRobotsTxt); }

  // StaticResources/web/ads.txt
  std::string adsTxt() const { return webUrl(staticResources(), kAdsTxt); }

  // Short backend name used in logs and the locations document.
  virtual const char* kind() const = 0;

  // Delegate serving "/web/..." requests, or nullptr when static resources
  // are delivered by something else (a bucket, a static host).
  virtual const StaticFileHandler* staticHandler() const { return nullptr; }

  // True when the provider can only describe a pre-rendered static website
  // and must not back a live server.
  virtual bool staticSiteOnly() const { return false; }
};

// Serves static resources from a local directory at the given path.
std::unique_ptr<ResourceProvider> localDir(const std::string& path);

// Provides static resources from a remote bucket such as Amazon S3 or Google
// Cloud Storage. Both the bucket root and its "/web" subpath are accepted.
std::unique_ptr<ResourceProvider> remoteBucket(const std::string& url);

// Provides resources from GitHub Pages under "/<repoName>". Only valid for
// generating a pre-rendered static website; it cannot back a live server.
std::unique_ptr<ResourceProvider> gitHubPages(const std::string& repoName);

} // namespace webres
