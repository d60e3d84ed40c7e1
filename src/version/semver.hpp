#pragma once

#include <cstdint>
#include <string_view>

namespace relsync::version {

struct SemanticVersion {
  std::uint64_t major = 0;
  std::uint64_t minor = 0;
  std::uint64_t patch = 0;
};

// Accepts "1.2.3" with an optional leading 'v' and ignores any "-pre" or
// "+build" suffix. Returns false for anything else.
bool ParseSemanticVersion(std::string_view text, SemanticVersion& version);

bool IsStrictlyNewer(const SemanticVersion& candidate, const SemanticVersion& baseline);

} // namespace relsync::version
