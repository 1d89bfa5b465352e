#include "process.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/process.hpp>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <mutex>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <utility>

namespace bp = boost::process;
namespace net = boost::asio;

static std::filesystem::path working_dir(const ProcessSpec &spec) {
  return spec.cwd.empty() ? std::filesystem::current_path() : spec.cwd;
}

static boost::filesystem::path resolve_executable(const ProcessSpec &spec) {
  if (spec.command.empty()) {
    throw ProcessLaunchError("Empty command");
  }

  if (spec.command.find('/') != std::string::npos) {
    std::filesystem::path exe(spec.command);
    if (exe.is_relative()) {
      exe = working_dir(spec) / exe;
    }
    if (!std::filesystem::exists(exe)) {
      throw ProcessLaunchError("Command not found: " + exe.string());
    }
    return boost::filesystem::path(exe.string());
  }

  boost::filesystem::path found = bp::search_path(spec.command);
  if (found.empty()) {
    throw ProcessLaunchError("Command not found in PATH: " + spec.command);
  }
  return found;
}

// Echoes each stderr line to std::cerr and appends it to captured.
static void tee_stderr(bp::ipstream &err_stream, std::string &captured) {
  std::string line;
  while (std::getline(err_stream, line)) {
    std::cerr << line << "\n";
    captured += line;
    captured += "\n";
  }
}

static void fill_status(ProcessResult &result, int native_status) {
  if (WIFSIGNALED(native_status)) {
    result.term_signal = WTERMSIG(native_status);
    result.exit_code = 128 + result.term_signal;
  } else if (WIFEXITED(native_status)) {
    result.exit_code = WEXITSTATUS(native_status);
  } else {
    result.exit_code = 1;
  }
}

std::string describe_command(const ProcessSpec &spec) {
  std::string line = spec.command;
  for (const auto &arg : spec.args) {
    line += " ";
    if (arg.find(' ') != std::string::npos) {
      line += "'" + arg + "'";
    } else {
      line += arg;
    }
  }
  return line;
}

ProcessResult run_process(const ProcessSpec &spec) {
  boost::filesystem::path exe = resolve_executable(spec);

  bp::ipstream err_stream;
  std::error_code ec;
  bp::child child(exe, bp::args(spec.args),
                  bp::start_dir(working_dir(spec).string()),
                  bp::std_err > err_stream, ec);
  if (ec) {
    throw ProcessLaunchError("Failed to start " + spec.command + ": " +
                             ec.message());
  }

  ProcessResult result;
  tee_stderr(err_stream, result.stderr_output);

  child.wait(ec);
  if (ec) {
    throw ProcessLaunchError("Failed to wait for " + spec.command + ": " +
                             ec.message());
  }

  fill_status(result, child.native_exit_code());
  return result;
}

ProcessResult run_until_interrupted(const ProcessSpec &spec,
                                    const SpawnCallback &on_spawn) {
  boost::filesystem::path exe = resolve_executable(spec);

  // Installed before the spawn so an early Ctrl-C is queued, not fatal.
  net::io_context io;
  net::signal_set signals(io, SIGINT, SIGTERM);

  bp::ipstream err_stream;
  std::error_code ec;
  bp::child child(exe, bp::args(spec.args),
                  bp::start_dir(working_dir(spec).string()),
                  bp::std_err > err_stream, ec);
  if (ec) {
    throw ProcessLaunchError("Failed to start " + spec.command + ": " +
                             ec.message());
  }

  std::atomic<bool> interrupted{false};
  // Guards exited so a forwarded signal never targets a reaped pid.
  std::mutex exit_mutex;
  bool exited = false;
  const pid_t pid = child.id();

  signals.async_wait([&](const boost::system::error_code &error, int signo) {
    if (error) {
      return;
    }
    interrupted = true;
    std::lock_guard<std::mutex> lock(exit_mutex);
    if (!exited) {
      ::kill(pid, signo);
    }
  });

  std::string captured;
  std::thread stderr_thread(
      [&err_stream, &captured] { tee_stderr(err_stream, captured); });

  if (on_spawn) {
    try {
      on_spawn(pid);
    } catch (...) {
      child.terminate(ec);
      stderr_thread.join();
      throw;
    }
  }

  std::thread signal_thread([&io] { io.run(); });

  // Wait without reaping: the pid stays a zombie until exited is set.
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) <
             0 &&
         errno == EINTR) {
  }
  {
    std::lock_guard<std::mutex> lock(exit_mutex);
    exited = true;
  }

  child.wait(ec);
  signals.cancel();
  signal_thread.join();
  stderr_thread.join();

  if (ec) {
    throw ProcessLaunchError("Failed to wait for " + spec.command + ": " +
                             ec.message());
  }

  ProcessResult result;
  fill_status(result, child.native_exit_code());
  result.interrupted = interrupted;
  result.stderr_output = std::move(captured);
  return result;
}

std::string tail_lines(const std::string &text, size_t max_lines) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    lines.push_back(line);
  }

  size_t start = lines.size() > max_lines ? lines.size() - max_lines : 0;
  std::string tail;
  for (size_t i = start; i < lines.size(); ++i) {
    tail += lines[i];
    tail += "\n";
  }
  return tail;
}
