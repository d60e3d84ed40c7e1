#include "../common/assertions.hpp"
#include "../common/fake_command_runner.hpp"
#include "publish/vcs_client.hpp"

#include <string>
#include <vector>

int main() {
  using relsync::core::process::CommandResult;
  using relsync::publish::GitClient;
  using relsync::publish::ParsePorcelainStatus;
  using relsync::tests::common::AssertContains;
  using relsync::tests::common::AssertEqual;
  using relsync::tests::common::Expect;
  using relsync::tests::common::FakeCommandRunner;

  FakeCommandRunner runner;
  GitClient git(runner, "/srv/mirror");
  std::string error;

  runner.handler = [](const FakeCommandRunner::Call& call, CommandResult& result, std::string&) {
    if (call.command_line.find("'status'") != std::string::npos) {
      result.output = " M index.toml\r\n?? mods/new.pw.toml\n\n";
    } else if (call.command_line.find("'rev-parse'") != std::string::npos) {
      result.output = "dev\n";
    }
    return true;
  };

  std::vector<std::string> changes;
  Expect(git.Status(changes, error), "status should succeed");
  Expect(changes.size() == 2U, "two porcelain entries");
  AssertEqual(changes[0], " M index.toml", "carriage return stripped");
  AssertEqual(runner.calls.back().command_line, "'git' 'status' '--porcelain'", "status argv");
  Expect(runner.calls.back().working_dir == "/srv/mirror", "runs inside the working copy");

  Expect(git.Commit("release 1.21.4 (0.16.10) it's done", error), "commit should succeed");
  AssertEqual(runner.calls.back().command_line,
              "'git' 'commit' '-m' 'release 1.21.4 (0.16.10) it'\\''s done'",
              "commit message is passed as one quoted argument");

  Expect(git.Merge("dev", "Merge branch 'dev' into main: release", error), "merge ok");
  AssertEqual(runner.calls.back().command_line,
              "'git' 'merge' '--no-ff' '-m' 'Merge branch '\\''dev'\\'' into main: release' 'dev'",
              "merge argv");

  Expect(git.Push("origin", "main", error), "push ok");
  AssertEqual(runner.calls.back().command_line, "'git' 'push' 'origin' 'main'", "push argv");

  std::string branch;
  Expect(git.CurrentBranch(branch, error), "current branch ok");
  AssertEqual(branch, "dev", "trailing newline trimmed");

  runner.handler = [](const FakeCommandRunner::Call&, CommandResult& result, std::string&) {
    result.output = "HEAD\n";
    return true;
  };
  Expect(!git.CurrentBranch(branch, error), "detached head is an error");
  AssertContains(error, "detached");

  runner.handler = [](const FakeCommandRunner::Call&, CommandResult& result, std::string&) {
    result.exit_code = 1;
    result.output = "To origin\n ! [rejected]        main -> main (non-fast-forward)\n";
    return true;
  };
  Expect(!git.Push("origin", "main", error), "rejected push must fail");
  AssertContains(error, "exited with code 1");
  AssertContains(error, "non-fast-forward");

  runner.handler = [](const FakeCommandRunner::Call&, CommandResult&, std::string& launch_error) {
    launch_error = "sh: not found";
    return false;
  };
  Expect(!git.AbortMerge(error), "launch failure must fail");
  AssertContains(error, "unable to run git");

  Expect(ParsePorcelainStatus("").empty(), "empty status means clean");
  return 0;
}
