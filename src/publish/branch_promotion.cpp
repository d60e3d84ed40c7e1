#include "publish/branch_promotion.hpp"

#include "core/logging/logger.hpp"

#include <string>

namespace relsync::publish {

namespace {

using core::errors::ErrorKind;

} // namespace

const char* ToString(const PromotionState state) {
  switch (state) {
  case PromotionState::kClean:
    return "Clean";
  case PromotionState::kCommitted:
    return "Committed";
  case PromotionState::kMergedToMain:
    return "MergedToMain";
  case PromotionState::kPushed:
    return "Pushed";
  case PromotionState::kRestored:
    return "Restored";
  }
  return "Unknown";
}

std::string FormatTransition(const PromotionState from, const PromotionState to) {
  return std::string(ToString(from)) + "->" + ToString(to);
}

std::string BuildMergeMessage(const std::string& working_branch,
                              const std::string& primary_branch,
                              const std::string& commit_message) {
  return "Merge branch '" + working_branch + "' into " + primary_branch + ": " + commit_message;
}

bool BranchPromotionWorkflow::Fail(PromotionReport& report, const PromotionState from,
                                   const PromotionState to, core::errors::Failure& failure,
                                   const ErrorKind kind, const std::string& message) {
  report.failed_transition = FormatTransition(from, to);
  failure = core::errors::MakeFailure(kind, message);
  logger_.Error("branch promotion step failed",
                {{"state", report.failed_transition},
                 {"error_code", core::errors::ToStableErrorCode(kind)},
                 {"error", message}});
  return false;
}

bool BranchPromotionWorkflow::Run(const PromotionRequest& request, PromotionReport& report,
                                  core::errors::Failure& failure) {
  report = PromotionReport{};
  report.direct = request.direct;

  std::string error;
  if (!vcs_.CurrentBranch(report.working_branch, error)) {
    return Fail(report, PromotionState::kClean, PromotionState::kCommitted, failure,
                ErrorKind::kVcsFailure, "unable to determine working branch: " + error);
  }

  if (!CommitIfDirty(request, report, failure)) {
    return false;
  }

  if (!request.direct && report.working_branch == request.primary_branch) {
    logger_.Info("already on primary branch, no merge needed",
                 {{"branch", report.working_branch}});
    report.direct = true;
  }

  if (report.direct) {
    return PushBranch(request, report.working_branch, report, failure);
  }

  const bool promoted = MergeIntoPrimary(request, report, failure) &&
                        PushBranch(request, request.primary_branch, report, failure);

  // Cleanup transition, taken on success and on every failure after the
  // checkout of the primary branch was attempted.
  if (report.switch_attempted) {
    RestoreWorkingBranch(report);
  }
  if (!promoted) {
    if (report.switch_attempted && !report.restored) {
      failure.message += "; restoring '" + report.working_branch +
                         "' also failed: " + report.restore_error;
    }
    return false;
  }
  if (!report.restored) {
    return Fail(report, PromotionState::kPushed, PromotionState::kRestored, failure,
                ErrorKind::kVcsFailure,
                "unable to switch back to '" + report.working_branch + "': " +
                    report.restore_error);
  }

  report.reached = PromotionState::kRestored;
  logger_.Info("branch promotion complete", {{"working_branch", report.working_branch},
                                             {"primary_branch", request.primary_branch}});
  return true;
}

bool BranchPromotionWorkflow::CommitIfDirty(const PromotionRequest& request,
                                            PromotionReport& report,
                                            core::errors::Failure& failure) {
  std::vector<std::string> changes;
  std::string error;
  if (!vcs_.Status(changes, error)) {
    return Fail(report, PromotionState::kClean, PromotionState::kCommitted, failure,
                ErrorKind::kVcsFailure, "status failed: " + error);
  }

  if (changes.empty()) {
    logger_.Info("working tree clean, nothing to commit", {{"branch", report.working_branch}});
  } else {
    if (!vcs_.AddAll(error) || !vcs_.Commit(request.commit_message, error)) {
      return Fail(report, PromotionState::kClean, PromotionState::kCommitted, failure,
                  ErrorKind::kVcsFailure, "commit failed: " + error);
    }
    report.committed = true;
    logger_.Info("committed working branch", {{"branch", report.working_branch},
                                              {"changes", std::to_string(changes.size())}});
  }
  report.reached = PromotionState::kCommitted;
  return true;
}

bool BranchPromotionWorkflow::MergeIntoPrimary(const PromotionRequest& request,
                                               PromotionReport& report,
                                               core::errors::Failure& failure) {
  std::string error;
  report.switch_attempted = true;
  if (!vcs_.Checkout(request.primary_branch, error)) {
    return Fail(report, PromotionState::kCommitted, PromotionState::kMergedToMain, failure,
                ErrorKind::kVcsFailure,
                "checkout of '" + request.primary_branch + "' failed: " + error);
  }

  const std::string message =
      BuildMergeMessage(report.working_branch, request.primary_branch, request.commit_message);
  if (!vcs_.Merge(report.working_branch, message, error)) {
    std::string abort_error;
    if (!vcs_.AbortMerge(abort_error)) {
      logger_.Warn("merge --abort failed", {{"error", abort_error}});
    }
    return Fail(report, PromotionState::kCommitted, PromotionState::kMergedToMain, failure,
                ErrorKind::kMergeConflict,
                "merging '" + report.working_branch + "' into '" + request.primary_branch +
                    "' failed: " + error);
  }

  report.reached = PromotionState::kMergedToMain;
  return true;
}

bool BranchPromotionWorkflow::PushBranch(const PromotionRequest& request,
                                         const std::string& branch, PromotionReport& report,
                                         core::errors::Failure& failure) {
  std::string error;
  if (!vcs_.Push(request.remote, branch, error)) {
    return Fail(report, report.reached, PromotionState::kPushed, failure,
                ErrorKind::kPushFailure,
                "push of '" + branch + "' to '" + request.remote + "' failed: " + error);
  }
  report.reached = PromotionState::kPushed;
  logger_.Info("pushed branch", {{"remote", request.remote}, {"branch", branch}});
  return true;
}

void BranchPromotionWorkflow::RestoreWorkingBranch(PromotionReport& report) {
  report.restore_attempted = true;
  std::string error;
  if (vcs_.Checkout(report.working_branch, error)) {
    report.restored = true;
    logger_.Info("restored working branch", {{"branch", report.working_branch}});
    return;
  }
  report.restore_error = error;
  logger_.Error("unable to restore working branch",
                {{"branch", report.working_branch}, {"error", error}});
}

} // namespace relsync::publish
