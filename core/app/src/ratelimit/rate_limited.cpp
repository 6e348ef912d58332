#include "tether/ratelimit/rate_limited.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tether {

bool isRateLimitMessage(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.find("rate") != std::string::npos &&
         lower.find("limit") != std::string::npos;
}

}  // namespace tether
