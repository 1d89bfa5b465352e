#include "serve_stage.hpp"
#include "core/errors.hpp"
#include "core/process.hpp"
#include "utils/console.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cctype>
#include <csignal>
#include <cstring>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <thread>

namespace net = boost::asio;

static bool same_header(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

static std::string join(const std::vector<std::string> &items,
                        const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      result += delimiter;
    result += items[i];
  }
  return result;
}

static std::string server_url(const std::string &host, int port) {
  return "http://" + host + ":" + std::to_string(port) + "/";
}

ServerOptions server_options(const DevLoopConfig &config) {
  ServerOptions options;
  options.root = config.output_dir();
  options.extensions = config.serve.extensions;
  options.directory_index = config.serve.directory_index;
  options.headers = config.serve.headers;
  return options;
}

std::vector<std::string> external_server_arguments(const DevLoopConfig &config) {
  std::vector<std::string> args = {config.output_dir().string(), "-c",
                                   join(config.serve.extensions, ",")};
  if (config.serve.directory_index) {
    args.push_back("-i");
  }

  for (const auto &[name, value] : config.serve.headers) {
    if (same_header(name, "Cross-Origin-Embedder-Policy") &&
        value == "require-corp") {
      args.push_back("--coep");
    } else if (same_header(name, "Cross-Origin-Opener-Policy") &&
               value == "same-origin") {
      args.push_back("--coop");
    } else {
      print_warning("External server cannot set header " + name + ": " +
                    value);
    }
  }

  args.push_back("--ip");
  args.push_back(config.serve.host);
  args.push_back("-p");
  args.push_back(std::to_string(config.serve.port));
  return args;
}

static void print_ready(const DevLoopConfig &config, int port) {
  size_t total_size = 0;
  size_t file_count = 0;
  std::error_code ec;
  for (const auto &entry :
       fs::recursive_directory_iterator(config.output_dir(), ec)) {
    std::error_code entry_ec;
    if (entry.is_regular_file(entry_ec)) {
      total_size += entry.file_size(entry_ec);
      file_count++;
    }
  }

  print_ok("Ready to serve");
  print_detail("Directory", config.output_dir().string());
  print_detail("Files", std::to_string(file_count) + " (" +
                            format_size(total_size) + ")");
  print_detail("Extensions", join(config.serve.extensions, ", "));
  for (const auto &[name, value] : config.serve.headers) {
    print_detail(name, value);
  }

  std::cout << "\n"
            << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Server started at " << termcolor::bright_cyan
            << server_url(config.serve.host, port) << termcolor::reset
            << "\n\n"
            << termcolor::bright_blue << "Press Ctrl-C to stop server..."
            << termcolor::reset << "\n\n";
}

static StepOutcome serve_builtin(const DevLoopConfig &config,
                                 const ReadyCallback &on_ready) {
  Server svr(server_options(config));
  svr.set_logger([](const Request &req, const Response &res) {
    log_request(req.method, req.path, res.status, res.body.size());
  });

  // Installed before bind so an interrupt at any point after this is queued.
  net::io_context io;
  net::signal_set signals(io, SIGINT, SIGTERM);

  if (!svr.bind(config.serve.host, config.serve.port)) {
    throw ServerLaunchFailure("Cannot listen on " + config.serve.host + ":" +
                              std::to_string(config.serve.port));
  }

  std::atomic<bool> interrupted{false};
  signals.async_wait([&](const boost::system::error_code &error, int signo) {
    if (error) {
      return;
    }
    interrupted = true;
    std::cout << "\n"
              << termcolor::bright_yellow << "⏳ " << strsignal(signo)
              << ", shutting down..." << termcolor::reset << "\n";
    svr.stop();
  });

  print_ready(config, svr.port());
  if (on_ready) {
    on_ready(config.serve.host, svr.port());
  }

  std::thread signal_thread([&io] { io.run(); });

  bool clean = svr.serve();

  signals.cancel();
  signal_thread.join();

  StepOutcome outcome;
  outcome.interrupted = interrupted;
  if (clean) {
    std::cout << termcolor::bright_green << "✓ Server stopped cleanly"
              << termcolor::reset << "\n\n";
  } else {
    outcome.exit_code = 1;
    print_error("Server stopped unexpectedly");
  }
  return outcome;
}

static StepOutcome serve_external(const DevLoopConfig &config,
                                  const ReadyCallback &on_ready) {
  ProcessSpec spec{config.serve.command, external_server_arguments(config),
                   config.workspace};
  print_detail("Command", describe_command(spec));

  ProcessResult result;
  try {
    result = run_until_interrupted(spec, [&](int pid) {
      print_ok("Server started (pid " + std::to_string(pid) + ") at " +
               server_url(config.serve.host, config.serve.port));
      if (on_ready) {
        on_ready(config.serve.host, config.serve.port);
      }
    });
  } catch (const ProcessLaunchError &e) {
    throw ServerLaunchFailure(e.what());
  }

  StepOutcome outcome;
  outcome.interrupted = result.interrupted;

  if (result.interrupted) {
    bool graceful = result.exit_code == 0 || result.term_signal == SIGINT ||
                    result.term_signal == SIGTERM;
    outcome.exit_code = graceful ? 0 : result.exit_code;
    std::cout << termcolor::bright_green << "✓ Server stopped"
              << termcolor::reset << "\n\n";
    return outcome;
  }

  if (!result.success()) {
    throw ServerLaunchFailure("Server exited with code " +
                                  std::to_string(result.exit_code),
                              result.exit_code, result.stderr_output);
  }
  return outcome;
}

StepOutcome serve_output(const DevLoopConfig &config,
                         const ReadyCallback &on_ready) {
  fs::path out_dir = config.output_dir();
  if (!fs::is_directory(out_dir)) {
    throw ServerLaunchFailure("Output directory not found: " +
                              out_dir.string());
  }

  if (config.serve.backend == ServerBackend::External) {
    return serve_external(config, on_ready);
  }
  return serve_builtin(config, on_ready);
}
