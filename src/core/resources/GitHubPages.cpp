#include "GitHubPages.hpp"

namespace webres {

GitHubPages::GitHubPages(std::string repoName) : repo_(std::move(repoName)) {
  if (repo_.empty() || repo_.front() != '/') repo_.insert(repo_.begin(), '/');
}

} // namespace webres
