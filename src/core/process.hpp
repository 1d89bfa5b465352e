#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

struct ProcessSpec {
  std::string command;
  std::vector<std::string> args;
  // Empty means the runner's current directory.
  std::filesystem::path cwd;
};

struct ProcessResult {
  int exit_code = 0;
  int term_signal = 0;
  // A SIGINT/SIGTERM reached the runner and was forwarded to the child.
  bool interrupted = false;
  std::string stderr_output;

  bool success() const { return exit_code == 0 && term_signal == 0; }
};

// The child could not be started at all (not found, not executable, ...).
class ProcessLaunchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using SpawnCallback = std::function<void(int pid)>;

std::string describe_command(const ProcessSpec &spec);

// Runs the command to completion. stdout is inherited; stderr is echoed to
// std::cerr line by line and also captured into the result.
ProcessResult run_process(const ProcessSpec &spec);

// Runs a long-lived command with inherited stdout; stderr is echoed and
// captured as in run_process(). SIGINT and SIGTERM sent to the runner are
// forwarded to the child, and the call returns once the child has exited.
ProcessResult run_until_interrupted(const ProcessSpec &spec,
                                    const SpawnCallback &on_spawn = {});

std::string tail_lines(const std::string &text, size_t max_lines);
