#ifndef STEPS_HPP
#define STEPS_HPP

#include "core/pipeline.hpp"
#include "utils/config.hpp"
#include <string>
#include <vector>

std::vector<std::string> build_arguments(const DevLoopConfig &config);

std::vector<std::string> bindings_arguments(const DevLoopConfig &config);

// cargo build --target <triple> -p <package>
StepOutcome build_artifact(const DevLoopConfig &config);

// Recreates the output directory, then runs wasm-bindgen on the artifact.
StepOutcome generate_bindings(const DevLoopConfig &config);

// Copies the entry HTML next to the generated glue.
StepOutcome stage_assets(const DevLoopConfig &config);

#endif
