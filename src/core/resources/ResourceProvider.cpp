#include "ResourceProvider.hpp"

#include "GitHubPages.hpp"
#include "LocalDir.hpp"
#include "RemoteBucket.hpp"

namespace webres {

std::string webUrl(const std::string& root, const char* file) {
  std::string out;
  out.reserve(root.size() + 6 + std::char_traits<char>::length(file));
  out.append(root).append(kWebPrefix).append("/").append(file);
  return out;
}

std::unique_ptr<ResourceProvider> localDir(const std::string& path) {
  return std::make_unique<LocalDir>(path);
}

std::unique_ptr<ResourceProvider> remoteBucket(const std::string& url) {
  return std::make_unique<RemoteBucket>(url);
}

std::unique_ptr<ResourceProvider> gitHubPages(const std::string& repoName) {
  return std::make_unique<GitHubPages>(repoName);
}

} // namespace webres
