#include "pipeline.hpp"
#include "core/errors.hpp"
#include "core/process.hpp"
#include "utils/console.hpp"
#include <chrono>
#include <iostream>
#include <termcolor/termcolor.hpp>

const char *to_string(RunnerState state) {
  switch (state) {
  case RunnerState::Idle:
    return "Idle";
  case RunnerState::Building:
    return "Building";
  case RunnerState::GeneratingBindings:
    return "GeneratingBindings";
  case RunnerState::Staging:
    return "Staging";
  case RunnerState::Serving:
    return "Serving";
  case RunnerState::Interrupted:
    return "Interrupted";
  case RunnerState::Terminated:
    return "Terminated";
  }
  return "Unknown";
}

void Pipeline::transition(RunnerState next) {
  RunnerState previous = state;
  state = next;
  history.push_back(next);
  if (observer) {
    observer(previous, next);
  }
}

void Pipeline::add_step(const std::string &name, RunnerState step_state,
                        StepFn invoke) {
  steps.push_back({name, step_state, std::move(invoke)});
}

PipelineResult Pipeline::run() {
  state = RunnerState::Idle;
  history.assign(1, RunnerState::Idle);

  PipelineResult result;
  StepOutcome outcome;

  for (const auto &step : steps) {
    transition(step.state);
    auto start = std::chrono::high_resolution_clock::now();

    try {
      outcome = step.invoke();
    } catch (const StepFailure &e) {
      transition(RunnerState::Terminated);

      std::cerr << "\n"
                << termcolor::bright_red << "✗ " << step.name << " failed: "
                << termcolor::reset << termcolor::bright_white << e.what()
                << termcolor::reset << "\n";
      if (e.exit_code()) {
        std::cerr << termcolor::bright_blue << "  Exit code: "
                  << termcolor::reset << *e.exit_code() << "\n";
      }
      if (!e.diagnostics().empty()) {
        std::cerr << termcolor::bright_blue << "  Last output:\n"
                  << termcolor::reset << tail_lines(e.diagnostics(), 10);
      }

      result.exit_code = e.status();
      result.final_state = state;
      result.failed_step = step.name;
      result.message = e.what();
      return result;
    } catch (const std::exception &) {
      transition(RunnerState::Terminated);
      throw;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << termcolor::bright_blue << "  " << step.name << " took "
              << duration.count() << "ms" << termcolor::reset << "\n";
  }

  transition(outcome.interrupted ? RunnerState::Interrupted
                                 : RunnerState::Terminated);
  result.exit_code = outcome.exit_code;
  result.final_state = state;
  return result;
}
