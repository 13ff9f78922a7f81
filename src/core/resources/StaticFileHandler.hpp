#pragma once
#include <string>

namespace httplib {
struct Request;
struct Response;
}

namespace webres {

// Serves "/web/..." requests from a local directory with the "/web" prefix
// stripped. Files are read from disk on every request; nothing is cached.
class StaticFileHandler {
public:
  explicit StaticFileHandler(std::string root) : root_(std::move(root)) {}

  // Returns false, leaving res untouched, when req.path is outside "/web".
  // Otherwise res holds the final status, headers and body.
  bool handle(const httplib::Request& req, httplib::Response& res) const;

  const std::string& root() const { return root_; }

private:
  std::string root_;
};

// Lexically cleans a URL path: always rooted, "." and ".." resolved without
// climbing above "/", duplicate slashes collapsed, trailing slash kept.
std::string clean_url_path(const std::string& path);

// Content type for a file name, from its extension.
const char* content_type_for(const std::string& name);

} // namespace webres
