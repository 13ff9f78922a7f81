#include "StaticFileHandler.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "ResourceProvider.hpp"
#include "core/util/Strings.hpp"

namespace fs = std::filesystem;

namespace webres {

// Files above this size are streamed instead of loaded into the body.
static constexpr size_t kInlineBodyLimit = 1024 * 1024;
static constexpr size_t kStreamChunk = 64 * 1024;

// -------- helpers --------

static void set_text(httplib::Response& res, int status, const char* body) {
  res.status = status;
  res.set_content(body, "text/plain; charset=utf-8");
}

static std::string http_date(std::time_t t) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return buf;
}

// IMF-fixdate only ("Sun, 06 Nov 1994 08:49:37 GMT").
static bool parse_http_date(const std::string& s, std::time_t& out) {
  static const char* kMonths = "JanFebMarAprMayJunJulAugSepOctNovDec";
  char wday[4] = {};
  char mon[4] = {};
  std::tm tm{};
  if (std::sscanf(s.c_str(), "%3s, %d %3s %d %d:%d:%d GMT", wday, &tm.tm_mday, mon,
                  &tm.tm_year, &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 7) {
    return false;
  }
  const char* m = std::strstr(kMonths, mon);
  if (!m || std::strlen(mon) != 3 || (m - kMonths) % 3 != 0) return false;
  tm.tm_mon = static_cast<int>((m - kMonths) / 3);
  tm.tm_year -= 1900;
#ifdef _WIN32
  out = _mkgmtime(&tm);
#else
  out = timegm(&tm);
#endif
  return out != static_cast<std::time_t>(-1);
}

static std::string weak_etag(long long size, std::time_t mtime) {
  std::ostringstream oss;
  oss << "W/\"" << std::hex << size << "-" << static_cast<long long>(mtime) << "\"";
  return oss.str();
}

static std::string strip_weak(std::string tag) {
  if (starts_with(tag, "W/")) tag.erase(0, 2);
  return tag;
}

// If-None-Match uses weak comparison for GET and HEAD.
static bool etag_matches(const std::string& header, const std::string& etag) {
  std::stringstream ss(header);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto b = item.find_first_not_of(" \t");
    auto e = item.find_last_not_of(" \t");
    if (b == std::string::npos) continue;
    item = item.substr(b, e - b + 1);
    if (item == "*" || strip_weak(item) == strip_weak(etag)) return true;
  }
  return false;
}

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&#34;"; break;
      case '\'': out += "&#39;"; break;
      default:   out += c;
    }
  }
  return out;
}

static std::string url_escape_path(const std::string& s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += k[c >> 4];
      out += k[c & 0xF];
    }
  }
  return out;
}

// -------- public helpers --------

std::string clean_url_path(const std::string& path) {
  std::vector<std::string> parts;
  std::string seg;
  std::stringstream ss(path);
  while (std::getline(ss, seg, '/')) {
    if (seg.empty() || seg == ".") continue;
    if (seg == "..") {
      if (!parts.empty()) parts.pop_back();
      continue;
    }
    parts.push_back(seg);
  }

  std::string out = "/";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += '/';
    out += parts[i];
  }
  bool trailing = ends_with(path, "/") || ends_with(path, "/.") || ends_with(path, "/..");
  if (trailing && out.size() > 1) out += '/';
  return out;
}

const char* content_type_for(const std::string& name) {
  struct Entry { const char* ext; const char* type; };
  static const Entry kTypes[] = {
    {".wasm",        "application/wasm"},
    {".js",          "text/javascript; charset=utf-8"},
    {".mjs",         "text/javascript; charset=utf-8"},
    {".css",         "text/css; charset=utf-8"},
    {".html",        "text/html; charset=utf-8"},
    {".htm",         "text/html; charset=utf-8"},
    {".json",        "application/json"},
    {".map",         "application/json"},
    {".webmanifest", "application/manifest+json"},
    {".txt",         "text/plain; charset=utf-8"},
    {".xml",         "text/xml; charset=utf-8"},
    {".svg",         "image/svg+xml"},
    {".png",         "image/png"},
    {".jpg",         "image/jpeg"},
    {".jpeg",        "image/jpeg"},
    {".gif",         "image/gif"},
    {".ico",         "image/x-icon"},
    {".webp",        "image/webp"},
    {".woff",        "font/woff"},
    {".woff2",       "font/woff2"},
  };

  auto dot = name.find_last_of('.');
  if (dot == std::string::npos) return "application/octet-stream";
  std::string ext = name.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& e : kTypes) {
    if (ext == e.ext) return e.type;
  }
  return "application/octet-stream";
}

// -------- serving --------

static void serve_listing(const fs::path& dir, httplib::Response& res) {
  std::error_code ec;
  std::vector<std::string> names;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    std::error_code dec;
    if (it->is_directory(dec)) name += '/';
    names.push_back(std::move(name));
  }
  if (ec) {
    spdlog::warn("cannot list {}: {}", dir.string(), ec.message());
    set_text(res, 500, "error reading directory");
    return;
  }
  std::sort(names.begin(), names.end());

  std::string body = "<pre>\n";
  for (const auto& n : names) {
    body += "<a href=\"" + html_escape(url_escape_path(n)) + "\">" + html_escape(n) + "</a>\n";
  }
  body += "</pre>\n";
  res.status = 200;
  res.set_content(body, "text/html; charset=utf-8");
}

static void serve_file(const fs::path& file,
                       const httplib::Request& req,
                       httplib::Response& res) {
  struct stat st{};
  if (::stat(file.string().c_str(), &st) != 0) {
    set_text(res, 404, "404 page not found");
    return;
  }

  const std::string etag = weak_etag(static_cast<long long>(st.st_size), st.st_mtime);
  res.set_header("ETag", etag);
  res.set_header("Last-Modified", http_date(st.st_mtime));

  bool not_modified = false;
  if (req.has_header("If-None-Match")) {
    not_modified = etag_matches(req.get_header_value("If-None-Match"), etag);
  } else if (req.has_header("If-Modified-Since")) {
    std::time_t since = 0;
    if (parse_http_date(req.get_header_value("If-Modified-Since"), since)) {
      not_modified = st.st_mtime <= since;
    }
  }
  if (not_modified) {
    res.status = 304;
    return;
  }

  auto in = std::make_shared<std::ifstream>(file, std::ios::binary);
  if (!*in) {
    spdlog::warn("cannot open {}", file.string());
    set_text(res, 500, "500 internal server error");
    return;
  }

  // httplib slices the body (or the provider's offsets) for Range requests
  // when it writes a 206.
  res.status = req.ranges.empty() ? 200 : 206;
  const char* type = content_type_for(file.filename().string());
  const auto size = static_cast<size_t>(st.st_size);

  if (req.method == "HEAD" || size > kInlineBodyLimit) {
    // Streamed in chunks; httplib never calls the provider for HEAD.
    const std::string name = file.string();
    res.set_content_provider(size, type,
        [in, name](size_t offset, size_t length, httplib::DataSink& sink) {
          std::vector<char> buf(std::min<size_t>(length, kStreamChunk));
          in->clear();
          in->seekg(static_cast<std::streamoff>(offset));
          in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
          const std::streamsize n = in->gcount();
          if (n <= 0) {
            spdlog::warn("read failed for {} at offset {}", name, offset);
            return false;
          }
          return sink.write(buf.data(), static_cast<size_t>(n));
        });
    return;
  }

  std::ostringstream buf;
  buf << in->rdbuf();
  if (in->bad()) {
    spdlog::warn("read failed for {}", file.string());
    set_text(res, 500, "500 internal server error");
    return;
  }
  res.set_content(buf.str(), type);
}

bool StaticFileHandler::handle(const httplib::Request& req, httplib::Response& res) const {
  const std::string prefix = kWebPrefix;
  const std::string& target = req.path;
  if (target != prefix && !starts_with(target, prefix + "/")) return false;

  if (req.method != "GET" && req.method != "HEAD") {
    res.set_header("Allow", "GET, HEAD");
    set_text(res, 405, "405 method not allowed");
    return true;
  }
  if (target.find('\0') != std::string::npos || target.find('\\') != std::string::npos) {
    set_text(res, 400, "400 bad request");
    return true;
  }
  if (target == prefix) {
    res.set_redirect(prefix + "/", 301);
    return true;
  }

  const std::string upath = clean_url_path(target.substr(prefix.size()));
  if (ends_with(upath, "/index.html")) {
    res.set_redirect(prefix + upath.substr(0, upath.size() - std::strlen("index.html")), 301);
    return true;
  }

  // "/main.css/" must stat "main.css" so a file with a trailing slash can be
  // redirected below.
  std::string relative = upath.substr(1);
  trim_suffix(relative, "/");
  const fs::path local = fs::path(root_) / fs::path(relative);
  std::error_code ec;
  const fs::file_status st = fs::status(local, ec);
  if (st.type() == fs::file_type::not_found ||
      ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    set_text(res, 404, "404 page not found");
    return true;
  }
  if (ec == std::errc::permission_denied) {
    set_text(res, 403, "403 Forbidden");
    return true;
  }
  if (ec) {
    spdlog::warn("stat {} failed: {}", local.string(), ec.message());
    set_text(res, 500, "500 internal server error");
    return true;
  }

  if (fs::is_directory(st)) {
    if (!ends_with(upath, "/")) {
      res.set_redirect(prefix + upath + "/", 301);
      return true;
    }
    const fs::path index = local / "index.html";
    std::error_code iec;
    if (fs::is_regular_file(index, iec)) {
      serve_file(index, req, res);
    } else {
      serve_listing(local, res);
    }
    return true;
  }

  if (ends_with(upath, "/")) {
    res.set_redirect(prefix + upath.substr(0, upath.size() - 1), 301);
    return true;
  }
  serve_file(local, req, res);
  return true;
}

} // namespace webres
