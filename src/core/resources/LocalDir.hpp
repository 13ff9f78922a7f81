#pragma once
#include <string>

#include "ResourceProvider.hpp"
#include "StaticFileHandler.hpp"

namespace webres {

// Serves static resources from a local directory. App resources and static
// resources are both rooted at "/"; the "/web" prefix is resolved by the
// handler, not by rewriting URLs.
class LocalDir : public ResourceProvider {
public:
  explicit LocalDir(std::string path)
    : path_(std::move(path)), handler_(path_) {}

  std::string appResources() const override { return {}; }
  std::string staticResources() const override { return {}; }
  const char* kind() const override { return "local"; }
  const StaticFileHandler* staticHandler() const override { return &handler_; }

  const std::string& path() const { return path_; }

private:
  std::string path_;
  StaticFileHandler handler_;
};

} // namespace webres
