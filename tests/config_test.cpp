#include "test_helpers.hpp"
#include "utils/config.hpp"
#include <gtest/gtest.h>

TEST(ConfigTest, DefaultsReproduceTheShellPipeline) {
  DevLoopConfig config;
  config.workspace = "/work";

  EXPECT_EQ(config.build.command, "cargo");
  EXPECT_EQ(config.build.target, "wasm32-unknown-unknown");
  EXPECT_EQ(config.build.package, "simple");
  EXPECT_EQ(config.artifact_path(),
            fs::path("/work/target/wasm32-unknown-unknown/debug/simple.wasm"));
  EXPECT_EQ(config.output_dir(), fs::path("/work/target/generated"));
  EXPECT_EQ(config.entry_html_path(), fs::path("/work/index.html"));
  EXPECT_EQ(config.glue_name(), "simple");
  EXPECT_TRUE(config.bindings.debug);

  EXPECT_EQ(config.serve.host, "127.0.0.1");
  EXPECT_EQ(config.serve.backend, ServerBackend::Builtin);
  EXPECT_TRUE(config.serve.directory_index);
  EXPECT_EQ(config.serve.extensions,
            (std::vector<std::string>{"wasm", "html", "js"}));

  ASSERT_EQ(config.serve.headers.size(), 2u);
  EXPECT_EQ(config.serve.headers[0].first, "Cross-Origin-Embedder-Policy");
  EXPECT_EQ(config.serve.headers[0].second, "require-corp");
  EXPECT_EQ(config.serve.headers[1].first, "Cross-Origin-Opener-Policy");
  EXPECT_EQ(config.serve.headers[1].second, "same-origin");
}

TEST(ConfigTest, PackageSelectionDrivesArtifactAndGlueName) {
  DevLoopConfig config;
  config.workspace = "/work";
  config.select_package("paint");

  EXPECT_EQ(config.artifact_path().filename(), "paint.wasm");
  EXPECT_EQ(config.glue_name(), "paint");

  config.bindings.out_name = "app";
  EXPECT_EQ(config.glue_name(), "app");
}

TEST(ConfigTest, ReleaseProfileChangesArtifactDirectory) {
  DevLoopConfig config;
  config.workspace = "/work";
  config.build.profile = BuildProfile::Release;

  EXPECT_EQ(config.artifact_path(),
            fs::path("/work/target/wasm32-unknown-unknown/release/simple.wasm"));
}

TEST(ConfigTest, LoadsOverridesFromYaml) {
  TempWorkspace ws;
  fs::path file = ws.write_file("devloop.yaml", R"(
target_dir: build
build:
  package: viewer
  profile: release
bindings:
  out_dir: dist
  out_name: app
  debug: false
stage:
  entry_html: web/index.html
serve:
  backend: external
  host: 127.0.0.2
  port: 9090
  extensions: [".WASM", html, js, css]
  directory_index: false
)");

  DevLoopConfig config = DevLoopConfig::load(file);

  EXPECT_EQ(config.workspace, ws.path());
  EXPECT_EQ(config.build.package, "viewer");
  EXPECT_EQ(config.build.profile, BuildProfile::Release);
  EXPECT_EQ(config.artifact_path(),
            ws.path() / "build/wasm32-unknown-unknown/release/viewer.wasm");
  EXPECT_EQ(config.output_dir(), ws.path() / "dist");
  EXPECT_EQ(config.glue_name(), "app");
  EXPECT_FALSE(config.bindings.debug);
  EXPECT_EQ(config.entry_html_path(), ws.path() / "web/index.html");
  EXPECT_EQ(config.serve.backend, ServerBackend::External);
  EXPECT_EQ(config.serve.host, "127.0.0.2");
  EXPECT_EQ(config.serve.port, 9090);
  EXPECT_FALSE(config.serve.directory_index);
  EXPECT_EQ(config.serve.extensions,
            (std::vector<std::string>{"wasm", "html", "js", "css"}));

  // Untouched keys keep their defaults.
  EXPECT_EQ(config.build.command, "cargo");
  EXPECT_EQ(config.serve.headers.size(), 2u);
}

TEST(ConfigTest, RelativeWorkspaceIsAnchoredAtConfigFile) {
  TempWorkspace ws;
  fs::path file = ws.write_file("conf/devloop.yaml", "workspace: ../app\n");

  DevLoopConfig config = DevLoopConfig::load(file);

  EXPECT_EQ(config.workspace, ws.path() / "app");
  EXPECT_EQ(config.output_dir(), ws.path() / "app/target/generated");
}

TEST(ConfigTest, HeadersAreMergedByName) {
  TempWorkspace ws;
  fs::path file = ws.write_file("devloop.yaml", R"(
serve:
  headers:
    Cross-Origin-Embedder-Policy: credentialless
    Cache-Control: no-store
)");

  DevLoopConfig config = DevLoopConfig::load(file);

  ASSERT_EQ(config.serve.headers.size(), 3u);
  EXPECT_EQ(config.serve.headers[0].second, "credentialless");
  EXPECT_EQ(config.serve.headers[1].second, "same-origin");
  EXPECT_EQ(config.serve.headers[2].first, "Cache-Control");
}

TEST(ConfigTest, EmptyFileKeepsDefaults) {
  TempWorkspace ws;
  fs::path file = ws.write_file("devloop.yaml", "");

  DevLoopConfig config = DevLoopConfig::load(file);

  EXPECT_EQ(config.workspace, ws.path());
  EXPECT_EQ(config.build.package, "simple");
}

TEST(ConfigTest, WrongTypeNamesTheKey) {
  TempWorkspace ws;
  fs::path file = ws.write_file("devloop.yaml", "serve:\n  port: eighty\n");

  try {
    DevLoopConfig::load(file);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError &e) {
    EXPECT_NE(std::string(e.what()).find("serve.port"), std::string::npos);
  }
}

TEST(ConfigTest, RejectsInvalidValues) {
  TempWorkspace ws;

  fs::path backend =
      ws.write_file("backend.yaml", "serve:\n  backend: nginx\n");
  EXPECT_THROW(DevLoopConfig::load(backend), ConfigError);

  fs::path profile = ws.write_file("profile.yaml", "build:\n  profile: fast\n");
  EXPECT_THROW(DevLoopConfig::load(profile), ConfigError);

  fs::path port = ws.write_file("port.yaml", "serve:\n  port: 70000\n");
  EXPECT_THROW(DevLoopConfig::load(port), ConfigError);

  fs::path section = ws.write_file("section.yaml", "build: cargo\n");
  EXPECT_THROW(DevLoopConfig::load(section), ConfigError);

  fs::path syntax = ws.write_file("syntax.yaml", "build: [unclosed\n");
  EXPECT_THROW(DevLoopConfig::load(syntax), ConfigError);
}

TEST(ConfigTest, MissingFileIsAConfigError) {
  EXPECT_THROW(DevLoopConfig::load("/nonexistent/devloop.yaml"), ConfigError);
}

TEST(ConfigTest, OutputDirectoryMustNotCoverTheProject) {
  TempWorkspace ws;
  DevLoopConfig config;
  config.workspace = ws.path();

  for (const char *dir : {".", "..", "target", "target/", "./target/..",
                          "target/wasm32-unknown-unknown"}) {
    config.bindings.out_dir = dir;
    EXPECT_THROW(config.validate(), ConfigError) << "out_dir " << dir;
  }

  config.bindings.out_dir = ws.path().string();
  EXPECT_THROW(config.validate(), ConfigError);

  config.bindings.out_dir = "web";
  config.stage.entry_html = "web/index.html";
  EXPECT_THROW(config.validate(), ConfigError);

  config.stage.entry_html = "index.html";
  EXPECT_NO_THROW(config.validate());

  config.bindings.out_dir = "target/generated";
  EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, LoadRejectsOutputDirectoryAtWorkspaceRoot) {
  TempWorkspace ws;
  fs::path file = ws.write_file("devloop.yaml", "bindings:\n  out_dir: .\n");

  EXPECT_THROW(DevLoopConfig::load(file), ConfigError);
}
