#include "dev_loop.hpp"
#include "core/steps.hpp"
#include "utils/console.hpp"
#include <chrono>

DevLoopRunner::DevLoopRunner(DevLoopConfig cfg) : config(std::move(cfg)) {}

void DevLoopRunner::assemble() {
  pipeline = Pipeline();
  pipeline.set_observer(state_observer);

  const DevLoopConfig &cfg = config;

  if (mode != RunMode::ServeOnly) {
    pipeline.add_step("build", RunnerState::Building, [&cfg] {
      print_step("Building " + cfg.build.package + " for " + cfg.build.target);
      return build_artifact(cfg);
    });
    pipeline.add_step("bindings", RunnerState::GeneratingBindings, [&cfg] {
      print_step("Generating bindings");
      return generate_bindings(cfg);
    });
    pipeline.add_step("stage", RunnerState::Staging, [&cfg] {
      print_step("Staging assets");
      return stage_assets(cfg);
    });
  }

  if (mode != RunMode::BuildOnly) {
    ReadyCallback on_ready = ready_callback;
    pipeline.add_step("serve", RunnerState::Serving, [&cfg, on_ready] {
      print_step("Serving " + cfg.output_dir().string());
      return serve_output(cfg, on_ready);
    });
  }
}

void DevLoopRunner::print_build_summary(long long elapsed_ms) const {
  print_summary_box("✨ Build Complete!",
                    {{"Package", config.build.package},
                     {"Output", config.output_dir().string()},
                     {"Time", std::to_string(elapsed_ms) + "ms"}});
}

PipelineResult DevLoopRunner::run() {
  auto start = std::chrono::high_resolution_clock::now();

  switch (mode) {
  case RunMode::Full:
    print_banner("🚀 Dev loop: " + config.build.package);
    break;
  case RunMode::BuildOnly:
    print_banner("🔨 Build: " + config.build.package);
    break;
  case RunMode::ServeOnly:
    print_banner("🌐 Serve: " + config.bindings.out_dir);
    break;
  }

  assemble();

  if (mode == RunMode::Full) {
    // Summary goes out before the serve step starts blocking.
    pipeline.set_observer([this, start](RunnerState from, RunnerState to) {
      if (to == RunnerState::Serving) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start);
        print_build_summary(elapsed.count());
      }
      if (state_observer) {
        state_observer(from, to);
      }
    });
  }

  PipelineResult result = pipeline.run();

  if (result.ok() && mode == RunMode::BuildOnly) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start);
    print_build_summary(elapsed.count());
  }

  if (!result.ok()) {
    print_error("Pipeline stopped at '" + *result.failed_step +
                "' (exit code " + std::to_string(result.exit_code) + ")");
  }

  return result;
}
