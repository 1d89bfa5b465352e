#ifndef SERVE_STAGE_HPP
#define SERVE_STAGE_HPP

#include "core/pipeline.hpp"
#include "server/server.hpp"
#include "utils/config.hpp"
#include <functional>
#include <string>
#include <vector>

// Called once the server accepts connections (builtin) or has been spawned
// (external), with the address it was bound to.
using ReadyCallback = std::function<void(const std::string &host, int port)>;

ServerOptions server_options(const DevLoopConfig &config);

std::vector<std::string> external_server_arguments(const DevLoopConfig &config);

// Serves the output directory until SIGINT/SIGTERM.
StepOutcome serve_output(const DevLoopConfig &config,
                         const ReadyCallback &on_ready = {});

#endif // SERVE_STAGE_HPP
