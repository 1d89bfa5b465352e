#ifndef CLI_HPP
#define CLI_HPP

#include "config.hpp"
#include <filesystem>
#include <optional>
#include <string>

// Bad command line; main prints the usage text after the message.
class UsageError : public ConfigError {
public:
  using ConfigError::ConfigError;
};

struct CliOptions {
  std::optional<std::string> package;
  std::optional<std::filesystem::path> config_path;
  std::optional<int> port;
  std::optional<std::string> backend;
  bool release = false;
  bool serve_only = false;
  bool no_serve = false;
  bool help = false;
};

void print_usage();

CliOptions parse_cli(int argc, const char *const argv[]);

// Config file (explicit, ./devloop.yaml, or defaults) with the command line
// applied on top and validated.
DevLoopConfig resolve_config(const CliOptions &options);

#endif // CLI_HPP
