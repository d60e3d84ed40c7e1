#pragma once

#include "version/version_lookup.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace relsync::core::logging {
class Logger;
}

namespace relsync::version {

struct RetryPolicy {
  std::uint32_t max_attempts = 3U;
  std::chrono::milliseconds base_delay{1000};
};

// Delay before retrying after failed attempt number `attempt` (1-based):
// base_delay * 2^(attempt-1), saturating instead of overflowing.
std::chrono::milliseconds ComputeRetryDelay(std::chrono::milliseconds base_delay,
                                            std::uint32_t attempt);

// Wraps another lookup with a bounded retry budget. Each failed attempt is
// logged at warn; the error of the last attempt is returned.
class RetryingVersionLookup final : public IVersionLookup {
public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  RetryingVersionLookup(IVersionLookup& inner, RetryPolicy policy, core::logging::Logger& logger,
                        SleepFn sleep = {});

  bool FetchVersions(std::vector<VersionRecord>& records, std::string& error) override;

  std::uint32_t attempts_used() const {
    return attempts_used_;
  }

private:
  IVersionLookup& inner_;
  RetryPolicy policy_;
  core::logging::Logger& logger_;
  SleepFn sleep_;
  std::uint32_t attempts_used_ = 0;
};

} // namespace relsync::version
