#pragma once

#include "core/errors/failure.hpp"
#include "version/version_lookup.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relsync::version {

// First record flagged stable, else the first record. Records with an empty
// version string are ignored. Returns false when nothing usable remains.
bool SelectLatestStable(const std::vector<VersionRecord>& records, std::string& selected);

// Resolution never fails. A lookup problem comes back as `warning`
// (kMetadataFetchFailure) with `spec.secondary` left at the recorded value.
struct ResolveResult {
  VersionSpec spec;
  bool primary_overridden = false;
  bool secondary_from_lookup = false;
  std::optional<core::errors::Failure> warning;
};

// An empty `explicit_primary` counts as not supplied.
ResolveResult ResolveVersions(const std::optional<std::string>& explicit_primary,
                              const std::string& current_primary,
                              const std::string& current_secondary, IVersionLookup& lookup);

} // namespace relsync::version
