#include "cli.hpp"
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "devloop - build, bind and serve a WebAssembly package\n\n";
  std::cout << "Usage:\n";
  std::cout << "  devloop [PACKAGE]          Build, generate bindings, stage "
               "and serve\n";
  std::cout << "  devloop serve              Serve the existing output "
               "directory\n\n";
  std::cout << "Options:\n";
  std::cout << "  --package NAME             Package to build (use this for a "
               "package named 'serve')\n";
  std::cout << "  --config FILE              Load FILE instead of "
               "./devloop.yaml\n";
  std::cout << "  --port N                   Port to serve on\n";
  std::cout << "  --server builtin|external  Server backend\n";
  std::cout << "  --release                  Build with the release profile\n";
  std::cout << "  --no-serve                 Stop after staging assets\n";
  std::cout << "  --help                     Show this help\n";
}

static int parse_port(const std::string &value) {
  size_t consumed = 0;
  int port = 0;
  try {
    port = std::stoi(value, &consumed);
  } catch (const std::logic_error &) {
    throw UsageError("Invalid port: " + value);
  }
  if (consumed != value.size()) {
    throw UsageError("Invalid port: " + value);
  }
  return port;
}

static void set_package(CliOptions &options, const std::string &name) {
  if (options.package) {
    throw UsageError("Package given twice: " + *options.package + " and " +
                     name);
  }
  options.package = name;
}

CliOptions parse_cli(int argc, const char *const argv[]) {
  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.help = true;
      return options;
    } else if (arg == "--config" || arg == "--port" || arg == "--server" ||
               arg == "--package") {
      if (i + 1 >= argc) {
        throw UsageError("Missing value for " + arg);
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        options.config_path = value;
      } else if (arg == "--port") {
        options.port = parse_port(value);
      } else if (arg == "--server") {
        options.backend = value;
      } else {
        set_package(options, value);
      }
    } else if (arg == "--release") {
      options.release = true;
    } else if (arg == "--no-serve") {
      options.no_serve = true;
    } else if (arg == "serve" && !options.package && !options.serve_only) {
      // A package called "serve" needs --package.
      options.serve_only = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw UsageError("Unknown option: " + arg);
    } else if (!options.package) {
      options.package = arg;
    } else {
      throw UsageError("Unexpected argument: " + arg);
    }
  }

  if (options.serve_only && options.no_serve) {
    throw UsageError("'serve' and --no-serve cannot be combined");
  }
  return options;
}

DevLoopConfig resolve_config(const CliOptions &options) {
  DevLoopConfig config;
  if (options.config_path) {
    config = DevLoopConfig::load(*options.config_path);
  } else if (fs::exists("devloop.yaml")) {
    config = DevLoopConfig::load("devloop.yaml");
  } else {
    config.workspace = fs::current_path();
  }

  if (options.package) {
    config.select_package(*options.package);
  }
  if (options.port) {
    config.serve.port = *options.port;
  }
  if (options.backend) {
    config.serve.backend = DevLoopConfig::parse_backend(*options.backend);
  }
  if (options.release) {
    config.build.profile = BuildProfile::Release;
  }
  config.validate();
  return config;
}
