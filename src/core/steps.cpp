#include "steps.hpp"
#include "core/errors.hpp"
#include "core/process.hpp"
#include "utils/console.hpp"
#include <system_error>

std::vector<std::string> build_arguments(const DevLoopConfig &config) {
  std::vector<std::string> args = {"build", "--target", config.build.target,
                                   "-p", config.build.package};
  if (config.build.profile == BuildProfile::Release) {
    args.push_back("--release");
  }
  return args;
}

std::vector<std::string> bindings_arguments(const DevLoopConfig &config) {
  std::vector<std::string> args = {config.artifact_path().string(),
                                   "--target",
                                   "web",
                                   "--no-typescript",
                                   "--out-dir",
                                   config.output_dir().string(),
                                   "--out-name",
                                   config.glue_name()};
  if (config.bindings.debug) {
    args.push_back("--debug");
    args.push_back("--keep-debug");
  }
  return args;
}

StepOutcome build_artifact(const DevLoopConfig &config) {
  ProcessSpec spec{config.build.command, build_arguments(config),
                   config.workspace};
  print_detail("Command", describe_command(spec));

  ProcessResult result;
  try {
    result = run_process(spec);
  } catch (const ProcessLaunchError &e) {
    throw BuildFailure(e.what());
  }

  if (!result.success()) {
    throw BuildFailure("Toolchain exited with code " +
                           std::to_string(result.exit_code) +
                           " while building package '" +
                           config.build.package + "'",
                       result.exit_code, result.stderr_output);
  }

  print_ok("Built " + config.artifact_path().filename().string());
  return {};
}

StepOutcome generate_bindings(const DevLoopConfig &config) {
  fs::path artifact = config.artifact_path();
  if (!fs::is_regular_file(artifact)) {
    throw BindingGenerationFailure("Compiled module not found: " +
                                   artifact.string());
  }

  try {
    config.check_output_dir();
  } catch (const ConfigError &e) {
    throw BindingGenerationFailure(e.what());
  }

  fs::path out_dir = config.output_dir();
  std::error_code ec;
  fs::remove_all(out_dir, ec);
  if (!ec) {
    fs::create_directories(out_dir, ec);
  }
  if (ec) {
    throw BindingGenerationFailure("Cannot prepare output directory " +
                                   out_dir.string() + ": " + ec.message());
  }

  ProcessSpec spec{config.bindings.command, bindings_arguments(config),
                   config.workspace};
  print_detail("Command", describe_command(spec));

  ProcessResult result;
  try {
    result = run_process(spec);
  } catch (const ProcessLaunchError &e) {
    throw BindingGenerationFailure(e.what());
  }

  if (!result.success()) {
    throw BindingGenerationFailure("Bindings generator exited with code " +
                                       std::to_string(result.exit_code),
                                   result.exit_code, result.stderr_output);
  }

  int generated = 0;
  try {
    for (const auto &entry : fs::directory_iterator(out_dir)) {
      if (entry.is_regular_file()) {
        print_ok(entry.path().filename().string() + " (" +
                 format_size(entry.file_size()) + ")");
        generated++;
      }
    }
  } catch (const fs::filesystem_error &e) {
    throw BindingGenerationFailure(std::string("Cannot list output: ") +
                                   e.what());
  }
  if (generated == 0) {
    print_warning("Bindings generator wrote nothing to " + out_dir.string());
  }
  return {};
}

StepOutcome stage_assets(const DevLoopConfig &config) {
  fs::path source = config.entry_html_path();
  fs::path out_dir = config.output_dir();

  if (!fs::is_regular_file(source)) {
    throw StagingFailure("Entry page not found: " + source.string());
  }
  if (!fs::is_directory(out_dir)) {
    throw StagingFailure("Output directory missing: " + out_dir.string());
  }

  fs::path destination = out_dir / source.filename();
  std::error_code ec;
  fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw StagingFailure("Cannot copy " + source.string() + " to " +
                         destination.string() + ": " + ec.message());
  }

  print_ok(source.filename().string() + " → " + out_dir.string());
  return {};
}
