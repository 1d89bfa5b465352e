#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <list>
#include <memory>
#include <iostream>
#include <mutex>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

struct Request {
  std::string method;
  std::string path;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  void set_error(int code, const std::string &message) {
    status = code;
    set_content("<h1>" + std::to_string(code) + " - " + message + "</h1>",
                "text/html; charset=utf-8");
  }

  std::string to_http(bool include_body = true) const {
    std::ostringstream oss;

    oss << "HTTP/1.1 " << status << " " << get_status_text(status) << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (include_body) {
      oss << body;
    }
    return oss.str();
  }

  static std::string get_status_text(int code) {
    switch (code) {
    case 200:
      return "OK";
    case 301:
      return "Moved Permanently";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 500:
      return "Internal Server Error";
    default:
      return "Unknown";
    }
  }
};

struct ServerOptions {
  std::filesystem::path root;
  // Lower-case, without the leading dot.
  std::vector<std::string> extensions;
  bool directory_index = true;
  // Added to every response, errors included.
  std::vector<std::pair<std::string, std::string>> headers;
};

using Logger = std::function<void(const Request &, const Response &)>;

// Static file server for one directory. bind() and serve() are separate so a
// bind failure is reported before the accept loop starts. Each connection is
// handled on its own worker thread; stop() may be called from any thread and
// wakes both the accept loop and workers waiting on idle clients.
class Server {
private:
  int server_fd = -1;
  int bound_port = 0;
  std::atomic<bool> running{false};
  std::mutex fd_mutex;
  ServerOptions options;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::list<Worker> workers;
  std::unordered_set<int> client_fds;
  std::mutex client_mutex;
  std::mutex log_mutex;
  Logger logger;

  static constexpr size_t max_request_size = 64 * 1024;

  static Request parse_request(const std::string &raw) {
    Request req;
    std::istringstream iss(raw);
    std::string line;

    if (std::getline(iss, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      std::istringstream line_stream(line);
      line_stream >> req.method >> req.path >> req.version;
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
      if (line.back() == '\r') {
        line.pop_back();
      }
      size_t colon = line.find(':');
      if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        req.headers[key] = value_start == std::string::npos
                               ? std::string()
                               : line.substr(value_start);
      }
    }

    return req;
  }

  static bool url_decode(const std::string &in, std::string &out) {
    out.clear();
    for (size_t i = 0; i < in.size(); ++i) {
      if (in[i] == '%') {
        if (i + 2 >= in.size() ||
            !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
          return false;
        }
        out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
        i += 2;
      } else {
        out += in[i];
      }
    }
    return out.find('\0') == std::string::npos;
  }

  static std::string url_encode(const std::string &in) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
        out += static_cast<char>(c);
      } else {
        out += '%';
        out += hex[c >> 4];
        out += hex[c & 0x0F];
      }
    }
    return out;
  }

  static std::string html_escape(const std::string &in) {
    std::string out;
    for (char c : in) {
      switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
      }
    }
    return out;
  }

  static std::string extension_of(const std::filesystem::path &path) {
    std::string ext = path.extension().string();
    if (!ext.empty()) {
      ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
  }

  static std::string get_mime_type(const std::string &ext) {
    static const std::unordered_map<std::string, std::string> types = {
        {"wasm", "application/wasm"},
        {"js", "text/javascript"},
        {"mjs", "text/javascript"},
        {"html", "text/html; charset=utf-8"},
        {"htm", "text/html; charset=utf-8"},
        {"css", "text/css"},
        {"json", "application/json"},
        {"map", "application/json"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"ico", "image/x-icon"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf", "font/ttf"},
        {"txt", "text/plain"},
    };
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
  }

  bool is_allowed(const std::filesystem::path &path) const {
    std::string ext = extension_of(path);
    return std::find(options.extensions.begin(), options.extensions.end(),
                     ext) != options.extensions.end();
  }

  static bool send_all(int fd, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n =
          send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  static void serve_file(const std::filesystem::path &file_path,
                         Response &res) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
      res.set_error(403, "Forbidden");
      return;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    res.set_content(content, get_mime_type(extension_of(file_path)));
  }

  void serve_listing(const std::filesystem::path &dir,
                     const std::string &url_path, Response &res) {
    std::vector<std::string> dirs;
    std::vector<std::string> files;

    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
      std::string name = entry.path().filename().string();
      std::error_code entry_ec;
      if (entry.is_directory(entry_ec)) {
        dirs.push_back(name);
      } else if (entry.is_regular_file(entry_ec) &&
                 is_allowed(entry.path())) {
        files.push_back(name);
      }
    }
    if (ec) {
      res.set_error(500, "Internal Server Error");
      return;
    }

    std::sort(dirs.begin(), dirs.end());
    std::sort(files.begin(), files.end());

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
         << "<title>Index of " << html_escape(url_path) << "</title></head>\n"
         << "<body><h1>Index of " << html_escape(url_path) << "</h1>\n<ul>\n";
    if (url_path != "/") {
      html << "<li><a href=\"../\">../</a></li>\n";
    }
    for (const auto &name : dirs) {
      html << "<li><a href=\"" << url_encode(name) << "/\">"
           << html_escape(name) << "/</a></li>\n";
    }
    for (const auto &name : files) {
      html << "<li><a href=\"" << url_encode(name) << "\">"
           << html_escape(name) << "</a></li>\n";
    }
    html << "</ul></body></html>\n";

    res.set_content(html.str(), "text/html; charset=utf-8");
  }

  void route(const Request &req, Response &res) {
    if (req.method != "GET" && req.method != "HEAD") {
      res.set_error(405, "Method Not Allowed");
      res.headers["Allow"] = "GET, HEAD";
      return;
    }

    std::string raw_path = req.path;
    size_t query_pos = raw_path.find_first_of("?#");
    if (query_pos != std::string::npos) {
      raw_path = raw_path.substr(0, query_pos);
    }

    std::string url_path;
    if (raw_path.empty() || raw_path[0] != '/' ||
        !url_decode(raw_path, url_path)) {
      res.set_error(400, "Bad Request");
      return;
    }

    std::filesystem::path relative;
    std::istringstream segments(url_path.substr(1));
    std::string segment;
    while (std::getline(segments, segment, '/')) {
      if (segment.empty() || segment == ".") {
        continue;
      }
      if (segment == "..") {
        res.set_error(403, "Forbidden");
        return;
      }
      relative /= segment;
    }

    std::filesystem::path target = options.root / relative;
    std::error_code ec;

    if (std::filesystem::is_directory(target, ec)) {
      if (url_path.back() != '/') {
        res.status = 301;
        res.headers["Location"] = url_path + "/";
        res.set_content("", "text/plain");
        return;
      }

      std::filesystem::path index = target / "index.html";
      if (is_allowed(index) && std::filesystem::is_regular_file(index, ec)) {
        serve_file(index, res);
      } else if (options.directory_index) {
        serve_listing(target, url_path, res);
      } else {
        res.set_error(404, "Not Found");
      }
      return;
    }

    if (std::filesystem::is_regular_file(target, ec) && is_allowed(target)) {
      serve_file(target, res);
      return;
    }

    res.set_error(404, "Not Found");
  }

  void handle_client(int client_fd) {
    timeval timeout{};
    timeout.tv_sec = 5;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string raw;
    char buffer[8192];
    while (raw.find("\r\n\r\n") == std::string::npos &&
           raw.size() < max_request_size) {
      ssize_t bytes = recv(client_fd, buffer, sizeof(buffer), 0);
      if (bytes < 0 && errno == EINTR) {
        continue;
      }
      if (bytes <= 0) {
        break;
      }
      raw.append(buffer, static_cast<size_t>(bytes));
    }

    if (raw.empty()) {
      release_client(client_fd);
      return;
    }

    Request req = parse_request(raw);
    Response res;

    if (req.method.empty() || req.path.empty()) {
      res.set_error(400, "Bad Request");
    } else {
      route(req, res);
    }

    for (const auto &[name, value] : options.headers) {
      res.headers[name] = value;
    }

    if (logger) {
      std::lock_guard<std::mutex> lock(log_mutex);
      logger(req, res);
    }

    if (!send_all(client_fd, res.to_http(req.method != "HEAD"))) {
      std::cerr << "Failed to send response for " << req.path << ": "
                << strerror(errno) << "\n";
    }
    release_client(client_fd);
  }

  // Dropped from the set before close() so stop() never touches a reused fd.
  void release_client(int client_fd) {
    {
      std::lock_guard<std::mutex> lock(client_mutex);
      client_fds.erase(client_fd);
    }
    close(client_fd);
  }

  void spawn_worker(int client_fd) {
    {
      std::lock_guard<std::mutex> lock(client_mutex);
      client_fds.insert(client_fd);
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, client_fd, done] {
      handle_client(client_fd);
      *done = true;
    });
    workers.push_back(Worker{std::move(thread), std::move(done)});
  }

  // Joins finished workers, or all of them when wait_all is set.
  void reap_workers(bool wait_all) {
    for (auto it = workers.begin(); it != workers.end();) {
      if (wait_all || *it->done) {
        if (it->thread.joinable()) {
          it->thread.join();
        }
        it = workers.erase(it);
      } else {
        ++it;
      }
    }
  }

  void wake_clients() {
    std::lock_guard<std::mutex> lock(client_mutex);
    for (int fd : client_fds) {
      shutdown(fd, SHUT_RDWR);
    }
  }

  void close_listener() {
    std::lock_guard<std::mutex> lock(fd_mutex);
    if (server_fd != -1) {
      close(server_fd);
      server_fd = -1;
    }
  }

public:
  explicit Server(ServerOptions opts) : options(std::move(opts)) {}

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  ~Server() {
    stop();
    reap_workers(true);
    close_listener();
  }

  void set_logger(Logger log_handler) { logger = std::move(log_handler); }

  int port() const { return bound_port; }

  bool is_listening() const { return running; }

  // Port 0 asks the kernel for an ephemeral port; see port().
  bool bind(const std::string &host, int port) {
    std::lock_guard<std::mutex> lock(fd_mutex);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    std::string address = host == "localhost" ? "127.0.0.1" : host;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      std::cerr << "Invalid IPv4 address: " << host << "\n";
      return false;
    }

    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd == -1) {
      std::cerr << "Failed to create socket: " << strerror(errno) << "\n";
      return false;
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) <
        0) {
      std::cerr << "Failed to set SO_REUSEADDR: " << strerror(errno) << "\n";
    }

    if (::bind(server_fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
      std::cerr << "Bind failed on " << host << ":" << port << ": "
                << strerror(errno) << "\n";
      close(server_fd);
      server_fd = -1;
      return false;
    }

    if (::listen(server_fd, 64) < 0) {
      std::cerr << "Listen failed: " << strerror(errno) << "\n";
      close(server_fd);
      server_fd = -1;
      return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd, (sockaddr *)&bound, &bound_len) == 0) {
      bound_port = ntohs(bound.sin_port);
    } else {
      bound_port = port;
    }

    running = true;
    return true;
  }

  // Accept loop. Returns true after stop(), false if the listening socket
  // failed underneath it.
  bool serve() {
    bool clean = true;

    while (running) {
      sockaddr_in client_addr{};
      socklen_t client_len = sizeof(client_addr);
      int client_fd = accept(server_fd, (sockaddr *)&client_addr, &client_len);

      if (client_fd < 0) {
        if (!running) {
          break;
        }
        if (errno == EINTR || errno == ECONNABORTED || errno == EMFILE ||
            errno == ENFILE) {
          continue;
        }
        std::cerr << "Accept failed: " << strerror(errno) << "\n";
        clean = false;
        break;
      }

      reap_workers(false);
      spawn_worker(client_fd);
    }

    running = false;
    close_listener();
    wake_clients();
    reap_workers(true);
    return clean;
  }

  void stop() {
    running = false;
    std::lock_guard<std::mutex> lock(fd_mutex);
    if (server_fd != -1) {
      // Wakes a thread blocked in accept().
      shutdown(server_fd, SHUT_RDWR);
    }
    wake_clients();
  }
};
