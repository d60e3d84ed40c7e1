#include "version/retrying_version_lookup.hpp"

#include "core/logging/logger.hpp"

#include <limits>
#include <string>
#include <thread>
#include <utility>

namespace relsync::version {

std::chrono::milliseconds ComputeRetryDelay(const std::chrono::milliseconds base_delay,
                                            const std::uint32_t attempt) {
  if (attempt == 0U || base_delay.count() <= 0) {
    return std::chrono::milliseconds{0};
  }

  using Rep = std::chrono::milliseconds::rep;
  constexpr Rep kMax = std::numeric_limits<Rep>::max();
  Rep delay = base_delay.count();
  for (std::uint32_t i = 1U; i < attempt; ++i) {
    if (delay > kMax / 2) {
      return std::chrono::milliseconds{kMax};
    }
    delay *= 2;
  }
  return std::chrono::milliseconds{delay};
}

RetryingVersionLookup::RetryingVersionLookup(IVersionLookup& inner, RetryPolicy policy,
                                             core::logging::Logger& logger, SleepFn sleep)
    : inner_(inner), policy_(policy), logger_(logger), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

bool RetryingVersionLookup::FetchVersions(std::vector<VersionRecord>& records,
                                          std::string& error) {
  attempts_used_ = 0;
  const std::uint32_t max_attempts = policy_.max_attempts == 0U ? 1U : policy_.max_attempts;

  for (std::uint32_t attempt = 1U; attempt <= max_attempts; ++attempt) {
    ++attempts_used_;
    std::string attempt_error;
    if (inner_.FetchVersions(records, attempt_error)) {
      if (attempt > 1U) {
        logger_.Info("version lookup succeeded after retry",
                     {{"attempt", std::to_string(attempt)}});
      }
      error.clear();
      return true;
    }

    error = attempt_error;
    if (attempt < max_attempts) {
      const auto delay = ComputeRetryDelay(policy_.base_delay, attempt);
      logger_.Info("version lookup attempt failed",
                   {{"attempt", std::to_string(attempt)},
                    {"max_attempts", std::to_string(max_attempts)},
                    {"retry_in_ms", std::to_string(delay.count())},
                    {"error", attempt_error}});
      sleep_(delay);
    }
  }

  error = "giving up after " + std::to_string(max_attempts) + " attempt(s): " + error;
  return false;
}

} // namespace relsync::version
