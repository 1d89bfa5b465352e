#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// A pipeline step failed. Carries the step name, the child's exit code when
// an external process was involved, and whatever it wrote to stderr.
class StepFailure : public std::runtime_error {
private:
  std::string step_;
  std::optional<int> exit_code_;
  std::string diagnostics_;

public:
  StepFailure(std::string step, const std::string &message,
              std::optional<int> exit_code = std::nullopt,
              std::string diagnostics = "")
      : std::runtime_error(message), step_(std::move(step)),
        exit_code_(exit_code), diagnostics_(std::move(diagnostics)) {}

  const std::string &step() const { return step_; }
  const std::optional<int> &exit_code() const { return exit_code_; }
  const std::string &diagnostics() const { return diagnostics_; }

  // Process exit code to report for this failure.
  int status() const {
    if (exit_code_ && *exit_code_ != 0) {
      return *exit_code_;
    }
    return 1;
  }
};

class BuildFailure : public StepFailure {
public:
  BuildFailure(const std::string &message, std::optional<int> exit_code = {},
               std::string diagnostics = "")
      : StepFailure("build", message, exit_code, std::move(diagnostics)) {}
};

class BindingGenerationFailure : public StepFailure {
public:
  BindingGenerationFailure(const std::string &message,
                           std::optional<int> exit_code = {},
                           std::string diagnostics = "")
      : StepFailure("bindings", message, exit_code, std::move(diagnostics)) {}
};

class StagingFailure : public StepFailure {
public:
  explicit StagingFailure(const std::string &message)
      : StepFailure("stage", message) {}
};

class ServerLaunchFailure : public StepFailure {
public:
  ServerLaunchFailure(const std::string &message,
                      std::optional<int> exit_code = {},
                      std::string diagnostics = "")
      : StepFailure("serve", message, exit_code, std::move(diagnostics)) {}
};

#endif
