#pragma once

#include <string>
#include <vector>

namespace relsync::version {

// {primary, secondary}, e.g. a platform version and the loader built for it.
struct VersionSpec {
  std::string primary;
  std::string secondary;
};

inline bool operator==(const VersionSpec& lhs, const VersionSpec& rhs) {
  return lhs.primary == rhs.primary && lhs.secondary == rhs.secondary;
}

// One entry of the remote version list, in service order.
struct VersionRecord {
  std::string version;
  bool stable = false;
};

// Read-only source of secondary version records.
class IVersionLookup {
public:
  virtual ~IVersionLookup() = default;

  // Returns false with `error` set on transport or format failure. An empty
  // list is a successful fetch; the resolver treats it as a failure.
  virtual bool FetchVersions(std::vector<VersionRecord>& records, std::string& error) = 0;
};

// Stand-in used when no lookup endpoint is configured. Every fetch fails, so
// the resolver always falls back to the recorded secondary version.
class UnconfiguredVersionLookup final : public IVersionLookup {
public:
  bool FetchVersions(std::vector<VersionRecord>& records, std::string& error) override {
    records.clear();
    error = "no version lookup url configured";
    return false;
  }
};

} // namespace relsync::version
