#include "../common/assertions.hpp"
#include "../common/fake_vcs_client.hpp"
#include "core/logging/logger.hpp"
#include "publish/publish_coordinator.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

using relsync::core::errors::ErrorKind;
using relsync::core::errors::Failure;
using relsync::publish::PublishCoordinator;
using relsync::publish::PublishMode;
using relsync::publish::PublishRequest;
using relsync::publish::PublishResult;
using relsync::tests::common::AssertContains;
using relsync::tests::common::Expect;
using relsync::tests::common::FakeVcsClient;

PublishRequest MirrorRequest() {
  PublishRequest request;
  request.mode = PublishMode::kDirectMirror;
  request.commit_message = "release 1.21.4 (0.16.10)";
  return request;
}

bool JournalContains(const FakeVcsClient& vcs, const std::string& prefix) {
  for (const auto& entry : vcs.journal) {
    if (entry.rfind(prefix, 0) == 0U) {
      return true;
    }
  }
  return false;
}

void TestNoChangesSkipsCommitAndPush(relsync::core::logging::Logger& logger) {
  FakeVcsClient vcs;
  vcs.branch = "main";
  PublishCoordinator coordinator(vcs, logger);
  PublishResult result = PublishResult::kPublished;
  Failure failure;
  Expect(coordinator.Publish(MirrorRequest(), result, failure), "clean publish succeeds");
  Expect(result == PublishResult::kNoChanges, "clean tree reports NoChanges");
  Expect(vcs.commits == 0 && vcs.pushes == 0, "no commit and no push when clean");
  Expect(!JournalContains(vcs, "add"), "nothing staged when clean");
}

void TestChangesAreCommittedAndPushed(relsync::core::logging::Logger& logger) {
  FakeVcsClient vcs;
  vcs.branch = "main";
  vcs.pending_changes = {" M index.toml", " M pack.toml"};
  PublishCoordinator coordinator(vcs, logger);
  PublishResult result = PublishResult::kNoChanges;
  Failure failure;
  Expect(coordinator.Publish(MirrorRequest(), result, failure), "publish succeeds");
  Expect(result == PublishResult::kPublished, "changes are published");
  Expect(vcs.commits == 1 && vcs.pushes == 1, "one commit and one push");
  Expect(JournalContains(vcs, "commit main: release 1.21.4 (0.16.10)"), "commit message used");
  Expect(JournalContains(vcs, "push origin main"), "current branch pushed to remote");
}

void TestRejectedPushKeepsLocalCommit(relsync::core::logging::Logger& logger) {
  FakeVcsClient vcs;
  vcs.branch = "main";
  vcs.pending_changes = {" M index.toml"};
  vcs.fail_push = true;
  PublishCoordinator coordinator(vcs, logger);
  PublishResult result = PublishResult::kNoChanges;
  Failure failure;
  Expect(!coordinator.Publish(MirrorRequest(), result, failure), "rejected push fails");
  Expect(failure.kind == ErrorKind::kPushFailure, "push failure kind");
  AssertContains(failure.message, "non-fast-forward");
  Expect(vcs.commits == 1, "local commit stays in place");
  Expect(!JournalContains(vcs, "reset"), "no rollback attempted");
}

void TestPromotionDelegatesToWorkflow(relsync::core::logging::Logger& logger) {
  FakeVcsClient vcs;
  vcs.branch = "dev";
  vcs.pending_changes = {" M pack.toml"};
  PublishCoordinator coordinator(vcs, logger);
  PublishRequest request = MirrorRequest();
  request.mode = PublishMode::kBranchPromotion;
  PublishResult result = PublishResult::kNoChanges;
  Failure failure;
  Expect(coordinator.Publish(request, result, failure), "promotion succeeds");
  Expect(result == PublishResult::kPublished, "promotion publishes");
  Expect(vcs.branch == "dev", "working branch restored");
  Expect(coordinator.promotion_report().restored, "report records restoration");

  PublishRequest empty_message = request;
  empty_message.commit_message.clear();
  Expect(!coordinator.Publish(empty_message, result, failure), "empty message rejected");
  Expect(failure.kind == ErrorKind::kPreconditionFailure, "empty message is a precondition");
}

void TestPublishModeParsing() {
  PublishMode mode = PublishMode::kDirectMirror;
  std::string error;
  Expect(relsync::publish::ParsePublishMode("promote", mode, error) &&
             mode == PublishMode::kBranchPromotion,
         "promote parses");
  Expect(!relsync::publish::ParsePublishMode("merge", mode, error), "unknown mode rejected");
  AssertContains(error, "mirror|promote");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  relsync::core::logging::Logger logger(relsync::core::logging::LogLevel::kDebug, log_sink);
  TestNoChangesSkipsCommitAndPush(logger);
  TestChangesAreCommittedAndPushed(logger);
  TestRejectedPushKeepsLocalCommit(logger);
  TestPromotionDelegatesToWorkflow(logger);
  TestPublishModeParsing();
  return 0;
}
