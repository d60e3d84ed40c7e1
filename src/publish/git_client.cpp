#include "publish/vcs_client.hpp"

#include <cstddef>
#include <sstream>

namespace relsync::publish {

namespace {

constexpr std::size_t kGitErrorTailLines = 10U;

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

std::vector<std::string> ParsePorcelainStatus(const std::string& output) {
  std::vector<std::string> changes;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      changes.push_back(line);
    }
  }
  return changes;
}

bool GitClient::RunGit(const std::vector<std::string>& args, core::process::CommandResult& result,
                       std::string& error) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1U);
  argv.emplace_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  if (!runner_.Run(argv, working_copy_, result, error)) {
    error = "unable to run git: " + error;
    return false;
  }
  if (result.exit_code != 0) {
    error = core::process::JoinShellCommand(argv) + " exited with code " +
            std::to_string(result.exit_code);
    const std::string tail = core::process::TailLines(result.output, kGitErrorTailLines);
    if (!tail.empty()) {
      error += ": " + tail;
    }
    return false;
  }
  return true;
}

bool GitClient::Status(std::vector<std::string>& changes, std::string& error) {
  core::process::CommandResult result;
  if (!RunGit({"status", "--porcelain"}, result, error)) {
    return false;
  }
  changes = ParsePorcelainStatus(result.output);
  return true;
}

bool GitClient::AddAll(std::string& error) {
  core::process::CommandResult result;
  return RunGit({"add", "-A"}, result, error);
}

bool GitClient::Commit(const std::string& message, std::string& error) {
  core::process::CommandResult result;
  return RunGit({"commit", "-m", message}, result, error);
}

bool GitClient::Push(const std::string& remote, const std::string& branch, std::string& error) {
  core::process::CommandResult result;
  return RunGit({"push", remote, branch}, result, error);
}

bool GitClient::Checkout(const std::string& branch, std::string& error) {
  core::process::CommandResult result;
  return RunGit({"checkout", branch}, result, error);
}

bool GitClient::Merge(const std::string& branch, const std::string& message, std::string& error) {
  core::process::CommandResult result;
  return RunGit({"merge", "--no-ff", "-m", message, branch}, result, error);
}

bool GitClient::AbortMerge(std::string& error) {
  core::process::CommandResult result;
  return RunGit({"merge", "--abort"}, result, error);
}

bool GitClient::CurrentBranch(std::string& branch, std::string& error) {
  core::process::CommandResult result;
  if (!RunGit({"rev-parse", "--abbrev-ref", "HEAD"}, result, error)) {
    return false;
  }
  const std::string name = TrimTrailingNewlines(result.output);
  if (name.empty() || name == "HEAD") {
    error = "working copy is on a detached HEAD";
    return false;
  }
  branch = name;
  return true;
}

} // namespace relsync::publish
