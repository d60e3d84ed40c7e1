#pragma once

#include "core/process/command_runner.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace relsync::publish {

// Synchronous version-control operations on one working copy. Every call
// returns false with `error` set when the operation did not complete.
class IVcsClient {
public:
  virtual ~IVcsClient() = default;

  // Pending changes relative to HEAD, one entry per path. Empty means clean.
  virtual bool Status(std::vector<std::string>& changes, std::string& error) = 0;
  virtual bool AddAll(std::string& error) = 0;
  virtual bool Commit(const std::string& message, std::string& error) = 0;
  virtual bool Push(const std::string& remote, const std::string& branch, std::string& error) = 0;
  virtual bool Checkout(const std::string& branch, std::string& error) = 0;
  virtual bool Merge(const std::string& branch, const std::string& message,
                     std::string& error) = 0;
  virtual bool AbortMerge(std::string& error) = 0;
  virtual bool CurrentBranch(std::string& branch, std::string& error) = 0;
};

// `git` driven through an ICommandRunner inside `working_copy`.
class GitClient final : public IVcsClient {
public:
  GitClient(core::process::ICommandRunner& runner, std::filesystem::path working_copy)
      : runner_(runner), working_copy_(std::move(working_copy)) {}

  bool Status(std::vector<std::string>& changes, std::string& error) override;
  bool AddAll(std::string& error) override;
  bool Commit(const std::string& message, std::string& error) override;
  bool Push(const std::string& remote, const std::string& branch, std::string& error) override;
  bool Checkout(const std::string& branch, std::string& error) override;
  bool Merge(const std::string& branch, const std::string& message, std::string& error) override;
  bool AbortMerge(std::string& error) override;
  bool CurrentBranch(std::string& branch, std::string& error) override;

  const std::filesystem::path& working_copy() const {
    return working_copy_;
  }

private:
  bool RunGit(const std::vector<std::string>& args, core::process::CommandResult& result,
              std::string& error);

  core::process::ICommandRunner& runner_;
  std::filesystem::path working_copy_;
};

// Splits `git status --porcelain` output into non-empty lines.
std::vector<std::string> ParsePorcelainStatus(const std::string& output);

} // namespace relsync::publish
