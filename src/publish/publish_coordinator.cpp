#include "publish/publish_coordinator.hpp"

#include "core/logging/logger.hpp"

#include <vector>

namespace relsync::publish {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeFailure;

} // namespace

const char* ToString(const PublishMode mode) {
  switch (mode) {
  case PublishMode::kDirectMirror:
    return "mirror";
  case PublishMode::kBranchPromotion:
    return "promote";
  }
  return "mirror";
}

bool ParsePublishMode(std::string_view raw, PublishMode& mode, std::string& error) {
  if (raw == "mirror") {
    mode = PublishMode::kDirectMirror;
    return true;
  }
  if (raw == "promote") {
    mode = PublishMode::kBranchPromotion;
    return true;
  }
  error = "invalid publish mode '" + std::string(raw) + "' (expected mirror|promote)";
  return false;
}

const char* ToString(const PublishResult result) {
  switch (result) {
  case PublishResult::kPublished:
    return "published";
  case PublishResult::kNoChanges:
    return "no_changes";
  }
  return "published";
}

bool PublishCoordinator::Publish(const PublishRequest& request, PublishResult& result,
                                 core::errors::Failure& failure) {
  if (request.commit_message.empty()) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure, "commit message cannot be empty");
    return false;
  }

  if (request.mode == PublishMode::kDirectMirror) {
    return PublishMirror(request, result, failure);
  }

  PromotionRequest promotion;
  promotion.commit_message = request.commit_message;
  promotion.primary_branch = request.primary_branch;
  promotion.remote = request.remote;
  promotion.direct = request.direct;

  BranchPromotionWorkflow workflow(vcs_, logger_);
  if (!workflow.Run(promotion, promotion_report_, failure)) {
    return false;
  }
  result = PublishResult::kPublished;
  return true;
}

bool PublishCoordinator::PublishMirror(const PublishRequest& request, PublishResult& result,
                                       core::errors::Failure& failure) {
  std::vector<std::string> changes;
  std::string error;
  if (!vcs_.Status(changes, error)) {
    failure = MakeFailure(ErrorKind::kVcsFailure, "status failed: " + error);
    return false;
  }
  if (changes.empty()) {
    logger_.Info("distribution unchanged, nothing to publish");
    result = PublishResult::kNoChanges;
    return true;
  }

  std::string branch;
  if (!vcs_.CurrentBranch(branch, error)) {
    failure = MakeFailure(ErrorKind::kVcsFailure, "unable to determine branch: " + error);
    return false;
  }
  if (!vcs_.AddAll(error) || !vcs_.Commit(request.commit_message, error)) {
    failure = MakeFailure(ErrorKind::kVcsFailure, "commit failed: " + error);
    return false;
  }
  logger_.Info("distribution committed",
               {{"branch", branch}, {"changes", std::to_string(changes.size())}});

  if (!vcs_.Push(request.remote, branch, error)) {
    logger_.Warn("local commit kept after rejected push", {{"branch", branch}});
    failure = MakeFailure(ErrorKind::kPushFailure,
                          "push of '" + branch + "' to '" + request.remote + "' failed: " + error);
    return false;
  }

  logger_.Info("distribution pushed", {{"remote", request.remote}, {"branch", branch}});
  result = PublishResult::kPublished;
  return true;
}

} // namespace relsync::publish
