#include "RemoteBucket.hpp"

#include "core/util/Strings.hpp"

namespace webres {

RemoteBucket::RemoteBucket(std::string url) : url_(std::move(url)) {
  trim_suffix(url_, "/");
  trim_suffix(url_, kWebPrefix);
}

} // namespace webres
