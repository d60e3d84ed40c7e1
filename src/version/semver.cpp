#include "version/semver.hpp"

#include <cctype>
#include <limits>
#include <tuple>

namespace relsync::version {

namespace {

bool ParseComponent(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  value = 0;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10U) {
      return false;
    }
    value = value * 10U + digit;
  }
  return true;
}

} // namespace

bool ParseSemanticVersion(std::string_view text, SemanticVersion& version) {
  if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
    text.remove_prefix(1);
  }
  const std::size_t suffix = text.find_first_of("-+");
  if (suffix != std::string_view::npos) {
    text = text.substr(0, suffix);
  }

  const std::size_t first_dot = text.find('.');
  if (first_dot == std::string_view::npos) {
    return false;
  }
  const std::size_t second_dot = text.find('.', first_dot + 1U);
  if (second_dot == std::string_view::npos) {
    return false;
  }

  SemanticVersion parsed;
  if (!ParseComponent(text.substr(0, first_dot), parsed.major) ||
      !ParseComponent(text.substr(first_dot + 1U, second_dot - first_dot - 1U), parsed.minor) ||
      !ParseComponent(text.substr(second_dot + 1U), parsed.patch)) {
    return false;
  }
  version = parsed;
  return true;
}

bool IsStrictlyNewer(const SemanticVersion& candidate, const SemanticVersion& baseline) {
  return std::tie(candidate.major, candidate.minor, candidate.patch) >
         std::tie(baseline.major, baseline.minor, baseline.patch);
}

} // namespace relsync::version
