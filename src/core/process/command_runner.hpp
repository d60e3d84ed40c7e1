#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace relsync::core::process {

struct CommandResult {
  int exit_code = -1;
  // Combined stdout and stderr.
  std::string output;
};

// Blocking external-process contract used for the build toolchain, the index
// generator and the version-control client.
//
// `Run*` returns false only when the process could not be launched at all.
// A launched process that exits non-zero still returns true; callers inspect
// `result.exit_code`.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  // Runs a shell command line with `working_dir` as current directory.
  virtual bool RunShell(const std::string& command_line, const std::filesystem::path& working_dir,
                        CommandResult& result, std::string& error) = 0;

  // Runs an argv vector. Each argument is shell-quoted, so arguments containing
  // spaces or quotes (commit messages) pass through unchanged.
  bool Run(const std::vector<std::string>& argv, const std::filesystem::path& working_dir,
           CommandResult& result, std::string& error);
};

// POSIX single-quote quoting: abc -> 'abc', it's -> 'it'\''s'.
std::string ShellQuote(std::string_view raw);

std::string JoinShellCommand(const std::vector<std::string>& argv);

// popen-backed runner.
class ShellCommandRunner final : public ICommandRunner {
public:
  bool RunShell(const std::string& command_line, const std::filesystem::path& working_dir,
                CommandResult& result, std::string& error) override;
};

// Last `max_lines` lines of a command transcript, for error messages.
std::string TailLines(std::string_view text, std::size_t max_lines);

} // namespace relsync::core::process
