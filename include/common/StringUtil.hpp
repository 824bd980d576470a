#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace sessiondb::common {

/// Copy of sValue without leading and trailing whitespace.
inline std::string trim(const std::string& sValue) {
  const auto itBegin = std::find_if_not(sValue.begin(), sValue.end(),
                                        [](unsigned char c) { return std::isspace(c); });
  const auto itEnd = std::find_if_not(sValue.rbegin(), sValue.rend(),
                                      [](unsigned char c) { return std::isspace(c); })
                         .base();
  return itBegin < itEnd ? std::string(itBegin, itEnd) : std::string{};
}

}  // namespace sessiondb::common
