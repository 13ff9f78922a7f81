#pragma once
#include <string>

#include "ResourceProvider.hpp"

namespace webres {

// Every resource, app resources included, lives under the project path
// because GitHub Pages serves a repository from "/<repo>".
class GitHubPages : public ResourceProvider {
public:
  explicit GitHubPages(std::string repoName);

  std::string appResources() const override { return repo_; }
  std::string staticResources() const override { return repo_; }
  const char* kind() const override { return "pages"; }
  bool staticSiteOnly() const override { return true; }

private:
  std::string repo_;
};

} // namespace webres
