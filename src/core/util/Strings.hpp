#pragma once
#include <string>

namespace webres {

inline bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Removes suffix from the end of s once, if present.
inline void trim_suffix(std::string& s, const std::string& suffix) {
  if (ends_with(s, suffix)) s.resize(s.size() - suffix.size());
}

} // namespace webres
