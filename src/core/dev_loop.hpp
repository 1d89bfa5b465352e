#ifndef DEV_LOOP_HPP
#define DEV_LOOP_HPP

#include "core/pipeline.hpp"
#include "server/serve_stage.hpp"
#include "utils/config.hpp"
#include <string>
#include <utility>
#include <vector>

enum class RunMode {
  // build → bindings → stage → serve
  Full,
  // build → bindings → stage
  BuildOnly,
  // serve an existing output directory
  ServeOnly
};

class DevLoopRunner {
private:
  DevLoopConfig config;
  RunMode mode = RunMode::Full;
  Pipeline pipeline;
  StateObserver state_observer;
  ReadyCallback ready_callback;

  void assemble();
  void print_build_summary(long long elapsed_ms) const;

public:
  explicit DevLoopRunner(DevLoopConfig cfg);

  void set_mode(RunMode m) { mode = m; }

  void set_state_observer(StateObserver obs) {
    state_observer = std::move(obs);
  }

  void set_ready_callback(ReadyCallback cb) { ready_callback = std::move(cb); }

  // Runs the whole chain and returns the result; exit_code is what the
  // process should exit with.
  PipelineResult run();

  RunnerState state() const { return pipeline.current_state(); }

  const std::vector<RunnerState> &get_history() const {
    return pipeline.get_history();
  }
};

#endif
