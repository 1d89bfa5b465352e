#pragma once

#include "utils/config.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Scratch directory removed on destruction.
class TempWorkspace {
private:
  fs::path root;

public:
  TempWorkspace() {
    std::string pattern =
        (fs::temp_directory_path() / "devloop-test-XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    root = fs::canonical(pattern);
  }

  ~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  const fs::path &path() const { return root; }

  fs::path write_file(const std::string &relative,
                      const std::string &content) const {
    fs::path target = root / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out << content;
    return target;
  }

  fs::path write_script(const std::string &relative,
                        const std::string &body) const {
    fs::path target = write_file(relative, body);
    fs::permissions(target,
                    fs::perms::owner_all | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec);
    return target;
  }

  std::string read_file(const std::string &relative) const {
    std::ifstream in(root / relative, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }
};

// file name -> contents, for comparing output directories
inline std::map<std::string, std::string> snapshot(const fs::path &dir) {
  std::map<std::string, std::string> files;
  for (const auto &entry : fs::recursive_directory_iterator(dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::ifstream in(entry.path(), std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    files[fs::relative(entry.path(), dir).string()] = buffer.str();
  }
  return files;
}

// Stand-ins for cargo, wasm-bindgen and simple-http-server. Each appends its
// command line to calls.log in the workspace.
inline void install_fake_toolchain(const TempWorkspace &ws,
                                   DevLoopConfig &config) {
  const std::string log = (ws.path() / "calls.log").string();

  ws.write_script("tools/cargo", R"(#!/bin/sh
echo "cargo $*" >> ")" + log + R"("
target=""
pkg=""
while [ $# -gt 0 ]; do
  case "$1" in
    --target) target="$2"; shift ;;
    -p) pkg="$2"; shift ;;
  esac
  shift
done
if [ "$pkg" = "broken" ]; then
  echo "error: package ID specification \`broken\` did not match any packages" >&2
  exit 101
fi
mkdir -p "target/$target/debug"
printf 'wasm-%s' "$pkg" > "target/$target/debug/$pkg.wasm"
)");

  ws.write_script("tools/wasm-bindgen", R"(#!/bin/sh
echo "wasm-bindgen $*" >> ")" + log + R"("
input="$1"
shift
out_dir=""
out_name=""
while [ $# -gt 0 ]; do
  case "$1" in
    --out-dir) out_dir="$2"; shift ;;
    --out-name) out_name="$2"; shift ;;
  esac
  shift
done
if [ ! -f "$input" ]; then
  echo "error: failed reading '$input'" >&2
  exit 1
fi
mkdir -p "$out_dir"
cp "$input" "$out_dir/${out_name}_bg.wasm"
printf 'import init from "./%s_bg.wasm";\nexport default init;\n' "$out_name" > "$out_dir/$out_name.js"
)");

  ws.write_script("tools/simple-http-server", R"(#!/bin/sh
trap 'exit 0' INT TERM
echo "simple-http-server $*" >> ")" + log + R"("
while :; do
  sleep 0.05
done
)");

  ws.write_file("index.html",
                "<!DOCTYPE html>\n<html><body>"
                "<script type=\"module\">import init from './simple.js'; "
                "init();</script></body></html>\n");

  config.workspace = ws.path();
  config.build.command = (ws.path() / "tools/cargo").string();
  config.bindings.command = (ws.path() / "tools/wasm-bindgen").string();
  config.serve.command = (ws.path() / "tools/simple-http-server").string();
  config.serve.port = 0;
}

inline http::response<http::string_body>
http_request(int port, const std::string &target,
             http::verb verb = http::verb::get,
             const std::string &host = "127.0.0.1") {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  stream.connect(resolver.resolve(host, std::to_string(port)));

  http::request<http::string_body> req{verb, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "devloop-tests");
  req.prepare_payload();
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  if (verb == http::verb::head) {
    parser.skip(true);
  }
  http::read(stream, buffer, parser);

  // The server closes first; not_connected here is expected.
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  return parser.release();
}
