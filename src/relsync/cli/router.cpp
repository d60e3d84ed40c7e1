#include "relsync/cli/router.hpp"

#include "artifacts/artifact_builder.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <iostream>

namespace relsync::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

constexpr std::string_view kVersionText = "relsync 0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  relsync release [--config <relsync.json>] [--primary <version>] [--upgrade] "
         "[--build] [--no-publish] [--mode <mirror|promote>] [--direct] [--message <text>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  relsync bump [--config <relsync.json>] [--primary <version>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  relsync hash <file>\n"
      << "  relsync version\n"
      << "  relsync help\n";
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersionText << '\n';
  return kExitSuccess;
}

int CommandHash(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: hash requires exactly 1 argument: <file>\n";
    return kExitUsage;
  }

  const std::filesystem::path path(args.front());
  artifacts::BuildArtifact artifact;
  std::string error;
  if (!artifacts::MeasureArtifact(path, artifact, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "path: " << artifact.path.string() << '\n'
            << "size_bytes: " << artifact.size_bytes << '\n'
            << "sha256: " << artifact.sha256 << '\n';
  return kExitSuccess;
}

int RunPipeline(const ReleaseCommandOptions& options) {
  core::logging::Logger logger(options.log_level);
  logger.SetRunId(core::MakeRunId(std::chrono::system_clock::now()));

  pipeline::PipelineRunner runner(pipeline::PipelineDependencies{}, logger);
  pipeline::PipelineSummary summary;
  const core::errors::ExitCode exit_code = runner.Run(options.pipeline, summary);

  if (summary.failure.has_value()) {
    std::cerr << "error: stage " << summary.failed_stage;
    if (!summary.failed_state.empty()) {
      std::cerr << " (state " << summary.failed_state << ")";
    }
    std::cerr << ": " << core::errors::FormatFailure(*summary.failure) << '\n';
    return core::errors::ToInt(exit_code);
  }

  std::cout << "versions: " << summary.versions.primary << " (" << summary.versions.secondary
            << ")\n";
  if (summary.artifact.has_value()) {
    std::cout << "artifact: " << summary.artifact->path.string() << " size_bytes="
              << summary.artifact->size_bytes << " sha256=" << summary.artifact->sha256 << '\n';
  }
  if (summary.publish_result.has_value()) {
    if (*summary.publish_result == publish::PublishResult::kNoChanges) {
      std::cout << "publish: nothing to publish\n";
    } else {
      std::cout << "publish: " << summary.commit_message << '\n';
    }
  }
  if (summary.warnings > 0U) {
    std::cout << "warnings: " << summary.warnings << '\n';
  }
  return core::errors::ToInt(exit_code);
}

int CommandRelease(const std::vector<std::string_view>& args, const bool bump_only) {
  ReleaseCommandOptions options;
  std::string error;
  if (!ParseReleaseOptions(args, bump_only, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return RunPipeline(options);
}

} // namespace

bool ParseReleaseOptions(const std::vector<std::string_view>& args, const bool bump_only,
                         ReleaseCommandOptions& options, std::string& error) {
  options = ReleaseCommandOptions{};
  pipeline::PipelineOptions& pipeline = options.pipeline;
  if (bump_only) {
    pipeline.bump_only = true;
    pipeline.upgrade = true;
    pipeline.publish = false;
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      pipeline.config_path = value;
      continue;
    }
    if (token == "--primary") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--primary requires a non-empty version";
        return false;
      }
      pipeline.explicit_primary = value;
      pipeline.upgrade = true;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!bump_only) {
      if (token == "--upgrade") {
        pipeline.upgrade = true;
        continue;
      }
      if (token == "--build") {
        pipeline.build = true;
        continue;
      }
      if (token == "--no-publish") {
        pipeline.publish = false;
        continue;
      }
      if (token == "--direct") {
        pipeline.direct = true;
        continue;
      }
      if (token == "--mode") {
        publish::PublishMode mode = publish::PublishMode::kDirectMirror;
        if (!TakeValue(args, i, token, value, error) ||
            !publish::ParsePublishMode(value, mode, error)) {
          return false;
        }
        pipeline.mode_override = mode;
        continue;
      }
      if (token == "--message") {
        if (!TakeValue(args, i, token, value, error)) {
          return false;
        }
        if (value.empty()) {
          error = "--message requires non-empty text";
          return false;
        }
        pipeline.commit_message = value;
        continue;
      }
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }

  if (pipeline.direct && pipeline.mode_override.has_value() &&
      *pipeline.mode_override == publish::PublishMode::kDirectMirror) {
    error = "--direct only applies to --mode promote";
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "release") {
    return CommandRelease(args, false);
  }
  if (command == "bump") {
    return CommandRelease(args, true);
  }
  if (command == "hash") {
    return CommandHash(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace relsync::cli
