#pragma once

#include "core/errors/failure.hpp"
#include "publish/vcs_client.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relsync::core::logging {
class Logger;
}

namespace relsync::publish {

enum class PromotionState {
  kClean,
  kCommitted,
  kMergedToMain,
  kPushed,
  kRestored,
};

const char* ToString(PromotionState state);

// "Committed->MergedToMain"
std::string FormatTransition(PromotionState from, PromotionState to);

struct PromotionRequest {
  std::string commit_message;
  std::string primary_branch = "main";
  std::string remote = "origin";
  // Commit and push the current branch without switching branches.
  bool direct = false;
};

struct PromotionReport {
  std::string working_branch;
  PromotionState reached = PromotionState::kClean;
  bool committed = false;
  bool direct = false;
  // Set once a checkout of the primary branch has been attempted. From then
  // on the workflow owes a checkout back to `working_branch`.
  bool switch_attempted = false;
  bool restore_attempted = false;
  bool restored = false;
  std::string restore_error;
  // Transition that failed, e.g. "Committed->MergedToMain". Empty on success.
  std::string failed_transition;
};

// Merge message used when promoting `working_branch` into `primary_branch`.
std::string BuildMergeMessage(const std::string& working_branch,
                              const std::string& primary_branch,
                              const std::string& commit_message);

// Clean -> Committed -> MergedToMain -> Pushed -> Restored.
//
// Once the primary branch has been checked out, the Restored transition runs
// on every exit path, successful or not. It cannot undo a merge or push that
// already happened; `report.reached` tells the operator how far the remote was
// affected. A failing merge is aborted before the checkout back.
class BranchPromotionWorkflow {
public:
  BranchPromotionWorkflow(IVcsClient& vcs, core::logging::Logger& logger)
      : vcs_(vcs), logger_(logger) {}

  bool Run(const PromotionRequest& request, PromotionReport& report,
           core::errors::Failure& failure);

private:
  bool CommitIfDirty(const PromotionRequest& request, PromotionReport& report,
                     core::errors::Failure& failure);
  bool MergeIntoPrimary(const PromotionRequest& request, PromotionReport& report,
                        core::errors::Failure& failure);
  bool PushBranch(const PromotionRequest& request, const std::string& branch,
                  PromotionReport& report, core::errors::Failure& failure);
  void RestoreWorkingBranch(PromotionReport& report);

  bool Fail(PromotionReport& report, PromotionState from, PromotionState to,
            core::errors::Failure& failure, core::errors::ErrorKind kind,
            const std::string& message);

  IVcsClient& vcs_;
  core::logging::Logger& logger_;
};

} // namespace relsync::publish
