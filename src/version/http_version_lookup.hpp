#pragma once

#include "version/version_lookup.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace relsync::version {

// Accepts either a top-level array of `{"version": "...", "stable": bool}`
// records or an object carrying such an array under "versions". Records
// without a string "version" are skipped; a missing "stable" means false.
bool ParseVersionRecords(std::string_view body, std::vector<VersionRecord>& records,
                         std::string& error);

// Single GET against the metadata service. `timeout` bounds the whole
// transfer including connect.
class HttpVersionLookup final : public IVersionLookup {
public:
  HttpVersionLookup(std::string url, std::chrono::milliseconds timeout);

  bool FetchVersions(std::vector<VersionRecord>& records, std::string& error) override;

private:
  std::string url_;
  std::chrono::milliseconds timeout_;
};

} // namespace relsync::version
