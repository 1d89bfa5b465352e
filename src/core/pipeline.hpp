#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class RunnerState {
  Idle,
  Building,
  GeneratingBindings,
  Staging,
  Serving,
  Interrupted,
  Terminated
};

const char *to_string(RunnerState state);

struct StepOutcome {
  int exit_code = 0;
  bool interrupted = false;
};

using StepFn = std::function<StepOutcome()>;
using StateObserver = std::function<void(RunnerState from, RunnerState to)>;

struct PipelineStep {
  std::string name;
  RunnerState state;
  StepFn invoke;
};

struct PipelineResult {
  int exit_code = 0;
  RunnerState final_state = RunnerState::Idle;
  std::optional<std::string> failed_step;
  std::string message;

  bool ok() const { return !failed_step.has_value(); }
};

// Ordered steps, each run to completion before the next one starts. The first
// StepFailure stops the chain and moves the state to Terminated.
class Pipeline {
private:
  std::vector<PipelineStep> steps;
  RunnerState state = RunnerState::Idle;
  std::vector<RunnerState> history;
  StateObserver observer;

  void transition(RunnerState next);

public:
  void add_step(const std::string &name, RunnerState state, StepFn invoke);

  void set_observer(StateObserver obs) { observer = std::move(obs); }

  PipelineResult run();

  RunnerState current_state() const { return state; }

  // Every state entered during the last run, starting with Idle.
  const std::vector<RunnerState> &get_history() const { return history; }
};

#endif // PIPELINE_HPP
