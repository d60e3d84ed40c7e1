#pragma once

#include "core/logging/logger.hpp"
#include "pipeline/pipeline_runner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace relsync::cli {

// Parsed `release` / `bump` invocation.
struct ReleaseCommandOptions {
  pipeline::PipelineOptions pipeline;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// `bump_only` restricts the accepted flags to --config, --primary and
// --log-level.
bool ParseReleaseOptions(const std::vector<std::string_view>& args, bool bump_only,
                         ReleaseCommandOptions& options, std::string& error);

// Routes `relsync` subcommands. Exit codes follow core::errors::ExitCode:
//   0  => success, including "nothing to publish"
//   1  => command failed after valid invocation
//   2  => usage error
//   10+ => pipeline failure class (see exit_codes.hpp)
int Dispatch(int argc, char** argv);

} // namespace relsync::cli
