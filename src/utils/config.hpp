#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class BuildProfile { Debug, Release };

enum class ServerBackend { Builtin, External };

struct BuildConfig {
  std::string command = "cargo";
  std::string target = "wasm32-unknown-unknown";
  std::string package = "simple";
  BuildProfile profile = BuildProfile::Debug;
};

struct BindingsConfig {
  std::string command = "wasm-bindgen";
  std::string out_dir = "target/generated";
  // Empty means "same as the package".
  std::string out_name;
  bool debug = true;
};

struct StageConfig {
  std::string entry_html = "index.html";
};

struct ServeConfig {
  ServerBackend backend = ServerBackend::Builtin;
  std::string command = "simple-http-server";
  std::string host = "127.0.0.1";
  int port = 8000;
  std::vector<std::string> extensions = {"wasm", "html", "js"};
  bool directory_index = true;
  std::vector<std::pair<std::string, std::string>> headers = {
      {"Cross-Origin-Embedder-Policy", "require-corp"},
      {"Cross-Origin-Opener-Policy", "same-origin"}};
};

class DevLoopConfig {
private:
  template <typename T>
  static void read_value(const YAML::Node &section, const char *key,
                         const std::string &qualified, T &out) {
    const YAML::Node node = section[key];
    if (!node) {
      return;
    }
    try {
      out = node.as<T>();
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid value for '" + qualified + "': " + e.msg);
    }
  }

  static YAML::Node section_of(const YAML::Node &root, const char *name) {
    YAML::Node section = root[name];
    if (section && !section.IsMap()) {
      throw ConfigError(std::string("Section '") + name + "' must be a map");
    }
    return section;
  }

  static std::string normalize_extension(std::string ext) {
    if (!ext.empty() && ext[0] == '.') {
      ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
  }

  static void set_header(std::vector<std::pair<std::string, std::string>> &headers,
                         const std::string &name, const std::string &value) {
    for (auto &[existing, existing_value] : headers) {
      if (existing == name) {
        existing_value = value;
        return;
      }
    }
    headers.emplace_back(name, value);
  }

  static fs::path normalized(const fs::path &path) {
    std::error_code ec;
    fs::path result = fs::weakly_canonical(fs::absolute(path), ec);
    if (ec) {
      result = fs::absolute(path).lexically_normal();
    }
    if (!result.has_filename() && result.has_parent_path() &&
        result != result.root_path()) {
      result = result.parent_path();
    }
    return result;
  }

  // True when inner is dir itself or lies somewhere below it.
  static bool contains(const fs::path &dir, const fs::path &inner) {
    fs::path outer = normalized(dir);
    fs::path target = normalized(inner);
    return std::mismatch(outer.begin(), outer.end(), target.begin(),
                         target.end())
               .first == outer.end();
  }

  fs::path resolve(const std::string &relative) const {
    fs::path path(relative);
    return path.is_absolute() ? path : workspace / path;
  }

public:
  fs::path workspace = ".";
  std::string target_dir = "target";

  BuildConfig build;
  BindingsConfig bindings;
  StageConfig stage;
  ServeConfig serve;

  static DevLoopConfig load(const fs::path &config_path) {
    DevLoopConfig config;

    if (!fs::exists(config_path)) {
      throw ConfigError("Config file not found: " + config_path.string());
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigError("Cannot parse " + config_path.string() + ": " + e.msg);
    }

    if (yaml.IsNull()) {
      config.workspace = fs::absolute(config_path).parent_path();
      return config;
    }
    if (!yaml.IsMap()) {
      throw ConfigError("Top level of " + config_path.string() +
                        " must be a map");
    }

    // Relative workspaces are anchored at the config file, not the cwd.
    std::string workspace;
    read_value(yaml, "workspace", "workspace", workspace);
    fs::path config_dir = fs::absolute(config_path).parent_path();
    if (workspace.empty()) {
      config.workspace = config_dir;
    } else if (fs::path(workspace).is_absolute()) {
      config.workspace = workspace;
    } else {
      config.workspace = (config_dir / workspace).lexically_normal();
    }

    read_value(yaml, "target_dir", "target_dir", config.target_dir);

    if (YAML::Node build = section_of(yaml, "build")) {
      read_value(build, "command", "build.command", config.build.command);
      read_value(build, "target", "build.target", config.build.target);
      read_value(build, "package", "build.package", config.build.package);

      std::string profile;
      read_value(build, "profile", "build.profile", profile);
      if (!profile.empty()) {
        config.build.profile = parse_profile(profile);
      }
    }

    if (YAML::Node bindings = section_of(yaml, "bindings")) {
      read_value(bindings, "command", "bindings.command",
                 config.bindings.command);
      read_value(bindings, "out_dir", "bindings.out_dir",
                 config.bindings.out_dir);
      read_value(bindings, "out_name", "bindings.out_name",
                 config.bindings.out_name);
      read_value(bindings, "debug", "bindings.debug", config.bindings.debug);
    }

    if (YAML::Node stage = section_of(yaml, "stage")) {
      read_value(stage, "entry_html", "stage.entry_html",
                 config.stage.entry_html);
    }

    if (YAML::Node serve = section_of(yaml, "serve")) {
      std::string backend;
      read_value(serve, "backend", "serve.backend", backend);
      if (!backend.empty()) {
        config.serve.backend = parse_backend(backend);
      }

      read_value(serve, "command", "serve.command", config.serve.command);
      read_value(serve, "host", "serve.host", config.serve.host);
      read_value(serve, "port", "serve.port", config.serve.port);
      read_value(serve, "directory_index", "serve.directory_index",
                 config.serve.directory_index);

      std::vector<std::string> extensions;
      read_value(serve, "extensions", "serve.extensions", extensions);
      if (serve["extensions"]) {
        config.serve.extensions.clear();
        for (const auto &ext : extensions) {
          config.serve.extensions.push_back(normalize_extension(ext));
        }
      }

      if (YAML::Node headers = serve["headers"]) {
        if (!headers.IsMap()) {
          throw ConfigError("'serve.headers' must be a map");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
          std::string name;
          std::string value;
          try {
            name = it->first.as<std::string>();
            value = it->second.as<std::string>();
          } catch (const YAML::Exception &e) {
            throw ConfigError("Invalid entry in 'serve.headers': " + e.msg);
          }
          set_header(config.serve.headers, name, value);
        }
      }
    }

    config.validate();
    return config;
  }

  static BuildProfile parse_profile(const std::string &value) {
    if (value == "debug" || value == "dev") {
      return BuildProfile::Debug;
    }
    if (value == "release") {
      return BuildProfile::Release;
    }
    throw ConfigError("Unknown build profile: " + value +
                      " (expected debug or release)");
  }

  static ServerBackend parse_backend(const std::string &value) {
    if (value == "builtin") {
      return ServerBackend::Builtin;
    }
    if (value == "external") {
      return ServerBackend::External;
    }
    throw ConfigError("Unknown server backend: " + value +
                      " (expected builtin or external)");
  }

  void validate() const {
    if (build.package.empty()) {
      throw ConfigError("'build.package' must not be empty");
    }
    if (serve.port < 0 || serve.port > 65535) {
      throw ConfigError("'serve.port' out of range: " +
                        std::to_string(serve.port));
    }
    if (serve.host.empty()) {
      throw ConfigError("'serve.host' must not be empty");
    }
    check_output_dir();
  }

  // The bindings step wipes output_dir(), so it must not hold the workspace,
  // the compiled module or the entry page.
  void check_output_dir() const {
    const fs::path out = output_dir();
    if (contains(out, workspace)) {
      throw ConfigError("'bindings.out_dir' (" + out.string() +
                        ") must not be the workspace or one of its parents");
    }
    if (contains(out, artifact_path())) {
      throw ConfigError("'bindings.out_dir' (" + out.string() +
                        ") must not contain the compiled module " +
                        artifact_path().string());
    }
    if (contains(out, entry_html_path())) {
      throw ConfigError("'bindings.out_dir' (" + out.string() +
                        ") must not contain the entry page " +
                        entry_html_path().string());
    }
  }

  void select_package(const std::string &package) { build.package = package; }

  std::string profile_dir() const {
    return build.profile == BuildProfile::Release ? "release" : "debug";
  }

  std::string glue_name() const {
    return bindings.out_name.empty() ? build.package : bindings.out_name;
  }

  fs::path artifact_path() const {
    return resolve(target_dir) / build.target / profile_dir() /
           (build.package + ".wasm");
  }

  fs::path output_dir() const { return resolve(bindings.out_dir); }

  fs::path entry_html_path() const { return resolve(stage.entry_html); }
};

#endif
