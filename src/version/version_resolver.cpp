#include "version/version_resolver.hpp"

namespace relsync::version {

bool SelectLatestStable(const std::vector<VersionRecord>& records, std::string& selected) {
  const VersionRecord* first_usable = nullptr;
  for (const auto& record : records) {
    if (record.version.empty()) {
      continue;
    }
    if (record.stable) {
      selected = record.version;
      return true;
    }
    if (first_usable == nullptr) {
      first_usable = &record;
    }
  }

  if (first_usable == nullptr) {
    return false;
  }
  selected = first_usable->version;
  return true;
}

ResolveResult ResolveVersions(const std::optional<std::string>& explicit_primary,
                              const std::string& current_primary,
                              const std::string& current_secondary, IVersionLookup& lookup) {
  ResolveResult result;
  result.spec.primary = current_primary;
  result.spec.secondary = current_secondary;

  if (explicit_primary.has_value() && !explicit_primary->empty()) {
    result.primary_overridden = *explicit_primary != current_primary;
    result.spec.primary = *explicit_primary;
  }

  std::vector<VersionRecord> records;
  std::string error;
  if (!lookup.FetchVersions(records, error)) {
    result.warning = core::errors::MakeFailure(core::errors::ErrorKind::kMetadataFetchFailure,
                                               "version lookup failed: " + error);
    return result;
  }

  std::string latest;
  if (!SelectLatestStable(records, latest)) {
    result.warning = core::errors::MakeFailure(core::errors::ErrorKind::kMetadataFetchFailure,
                                               "version lookup returned no usable versions");
    return result;
  }

  result.spec.secondary = latest;
  result.secondary_from_lookup = true;
  return result;
}

} // namespace relsync::version
