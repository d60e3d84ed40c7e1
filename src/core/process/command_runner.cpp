#include "core/process/command_runner.hpp"

#include <cstdio>

#include <sys/wait.h>

namespace relsync::core::process {

bool ICommandRunner::Run(const std::vector<std::string>& argv,
                         const std::filesystem::path& working_dir, CommandResult& result,
                         std::string& error) {
  if (argv.empty()) {
    error = "command argv cannot be empty";
    return false;
  }
  return RunShell(JoinShellCommand(argv), working_dir, result, error);
}

std::string ShellQuote(std::string_view raw) {
  std::string quoted;
  quoted.reserve(raw.size() + 2U);
  quoted.push_back('\'');
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string JoinShellCommand(const std::vector<std::string>& argv) {
  std::string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += ShellQuote(arg);
  }
  return joined;
}

bool ShellCommandRunner::RunShell(const std::string& command_line,
                                  const std::filesystem::path& working_dir, CommandResult& result,
                                  std::string& error) {
  result = CommandResult{};
  error.clear();

  if (command_line.empty()) {
    error = "command line cannot be empty";
    return false;
  }

  // The outer group carries the redirect so a failing `cd` is captured too.
  std::string wrapped = "{ ";
  if (!working_dir.empty()) {
    wrapped += "cd " + ShellQuote(working_dir.string()) + " && ";
  }
  wrapped += "{ " + command_line + " ; } ; } 2>&1";

  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute command: " + command_line;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    result.output.append(buffer);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect exit status for command: " + command_line;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else {
    result.exit_code = raw_status;
  }
  return true;
}

std::string TailLines(std::string_view text, const std::size_t max_lines) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  if (max_lines == 0U || text.empty()) {
    return "";
  }

  std::size_t lines_seen = 0;
  std::size_t pos = text.size();
  while (pos > 0U) {
    --pos;
    if (text[pos] == '\n') {
      ++lines_seen;
      if (lines_seen == max_lines) {
        return std::string(text.substr(pos + 1U));
      }
    }
  }
  return std::string(text);
}

} // namespace relsync::core::process
