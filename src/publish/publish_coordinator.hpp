#pragma once

#include "core/errors/failure.hpp"
#include "publish/branch_promotion.hpp"
#include "publish/vcs_client.hpp"

#include <string>
#include <string_view>

namespace relsync::core::logging {
class Logger;
}

namespace relsync::publish {

enum class PublishMode {
  // Commit and push the distribution working copy on its current branch.
  kDirectMirror,
  // Commit on the working branch, merge into the primary branch, push, switch
  // back. See BranchPromotionWorkflow.
  kBranchPromotion,
};

const char* ToString(PublishMode mode);
bool ParsePublishMode(std::string_view raw, PublishMode& mode, std::string& error);

enum class PublishResult {
  kPublished,
  kNoChanges,
};

const char* ToString(PublishResult result);

struct PublishRequest {
  PublishMode mode = PublishMode::kDirectMirror;
  std::string commit_message;
  std::string remote = "origin";
  std::string primary_branch = "main";
  // Branch promotion only: skip the merge into the primary branch.
  bool direct = false;
};

class PublishCoordinator {
public:
  PublishCoordinator(IVcsClient& vcs, core::logging::Logger& logger)
      : vcs_(vcs), logger_(logger) {}

  // A push rejection in mirror mode leaves the local commit in place.
  bool Publish(const PublishRequest& request, PublishResult& result,
               core::errors::Failure& failure);

  // Filled by the last branch-promotion publish.
  const PromotionReport& promotion_report() const {
    return promotion_report_;
  }

private:
  bool PublishMirror(const PublishRequest& request, PublishResult& result,
                     core::errors::Failure& failure);

  IVcsClient& vcs_;
  core::logging::Logger& logger_;
  PromotionReport promotion_report_;
};

} // namespace relsync::publish
