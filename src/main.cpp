#include "core/dev_loop.hpp"
#include "utils/cli.hpp"
#include "utils/console.hpp"
#include <iostream>
#include <stdexcept>

int main(int argc, char *argv[]) {
  try {
    CliOptions options = parse_cli(argc, argv);
    if (options.help) {
      print_usage();
      return 0;
    }

    DevLoopRunner runner(resolve_config(options));
    if (options.serve_only) {
      runner.set_mode(RunMode::ServeOnly);
    } else if (options.no_serve) {
      runner.set_mode(RunMode::BuildOnly);
    }

    return runner.run().exit_code;

  } catch (const UsageError &e) {
    print_error(e.what());
    print_usage();
    return 1;
  } catch (const ConfigError &e) {
    print_error(e.what());
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
