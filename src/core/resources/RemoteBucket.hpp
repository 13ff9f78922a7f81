#pragma once
#include <string>

#include "ResourceProvider.hpp"

namespace webres {

class RemoteBucket : public ResourceProvider {
public:
  // url is normalized: a trailing "/" then a trailing "/web" are removed.
  explicit RemoteBucket(std::string url);

  std::string appResources() const override { return {}; }
  std::string staticResources() const override { return url_; }
  const char* kind() const override { return "bucket"; }

private:
  std::string url_;
};

} // namespace webres
