#include "proctask/config/config.hpp"
#include "proctask/spec/task_spec.hpp"
#include "proctask/util/log.hpp"
#include "test_utils.hpp"

#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace proctask;
using namespace proctask::test;
namespace fs = std::filesystem;

TEST(ConfigTest, LogConfigDefaults) {
  LogConfig config;
  EXPECT_EQ(config.level, "info");
  EXPECT_TRUE(config.file.empty());
}

TEST(ConfigTest, LoadShellTask) {
  auto r = ConfigLoader::load_from_string(R"(
log:
  level: debug
tasks:
  - kind: shell
    id: list-root
    name: list
    cmd: ls
    args: ["-la", "a b"]
    cwd: /
    daemon: false
    timeout_ms: 2500
    trust_exit_code: false
    env:
      FOO: bar
      BAZ: "1"
)");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->log.level, "debug");
  ASSERT_EQ(r->tasks.size(), 1u);

  const auto& t = r->tasks[0];
  EXPECT_EQ(t.kind, SpecKind::Shell);
  EXPECT_EQ(t.id, "list-root");
  EXPECT_EQ(t.name, "list");
  EXPECT_EQ(t.cmd, "ls");
  ASSERT_EQ(t.args.size(), 2u);
  EXPECT_EQ(t.args[1], "a b");
  ASSERT_TRUE(t.cwd.has_value());
  EXPECT_EQ(t.cwd->string(), "/");
  EXPECT_EQ(t.daemon, false);
  EXPECT_EQ(t.timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(t.trust_exit_code, false);
  EXPECT_EQ(t.env.at("FOO"), "bar");
  EXPECT_EQ(t.env.at("BAZ"), "1");
}

TEST(ConfigTest, OmittedFields_StayUnset) {
  auto r = ConfigLoader::load_from_string(R"(
tasks:
  - cmd: ls
)");
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->tasks.size(), 1u);

  const auto& t = r->tasks[0];
  EXPECT_EQ(t.kind, SpecKind::Shell);
  EXPECT_FALSE(t.id.has_value());
  EXPECT_FALSE(t.name.has_value());
  EXPECT_FALSE(t.cwd.has_value());
  EXPECT_FALSE(t.daemon.has_value());
  EXPECT_FALSE(t.timeout.has_value());
  EXPECT_TRUE(t.args.empty());
  EXPECT_TRUE(t.env.empty());
}

TEST(ConfigTest, AliasKeys_SelectInterpreterVariant) {
  auto r = ConfigLoader::load_from_string(R"(
tasks:
  - php: /usr/bin/php
    file: /srv/jobs/report.php
    unknown_option: ignored
)");
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->tasks.size(), 1u);

  const auto& t = r->tasks[0];
  EXPECT_EQ(t.kind, SpecKind::Interpreter);
  EXPECT_EQ(t.interpreter, "/usr/bin/php");
  EXPECT_EQ(t.script, "/srv/jobs/report.php");
}

TEST(ConfigTest, ExplicitKind_WinsOverInference) {
  auto r = ConfigLoader::load_from_string(R"(
tasks:
  - kind: shell
    interpreter: /bin/sh
    cmd: ls
)");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->tasks[0].kind, SpecKind::Shell);
}

TEST(ConfigTest, LoadedOptions_BuildRunnableSpecs) {
  auto r = ConfigLoader::load_from_string(R"(
tasks:
  - name: list
    cmd: ls
    cwd: /
  - name: broken
    cmd: ls
)");
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->tasks.size(), 2u);

  SequentialIdGenerator ids;
  auto good = make_spec(r->tasks[0], ids);
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ((*good)->command(), "ls");
  EXPECT_EQ((*good)->id(), TaskId("task-1"));

  auto bad = make_spec(r->tasks[1], ids);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), make_error_code(Error::InvalidConfiguration));
}

TEST(ConfigTest, MalformedYaml_IsParseError) {
  auto r = ConfigLoader::load_from_string("tasks: [unclosed");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, WrongFieldType_IsParseError) {
  auto r = ConfigLoader::load_from_string(R"(
tasks:
  - cmd: ls
    daemon: maybe
)");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EmptyDocument_IsParseError) {
  auto r = ConfigLoader::load_from_string("");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MissingFile_IsFileNotFound) {
  auto r = ConfigLoader::load_from_file("/nonexistent/proctask.yaml");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileNotFound));
}

class ConfigFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = make_temp_dir();
    ASSERT_FALSE(test_dir_.empty());
  }

  void TearDown() override {
    ASSERT_TRUE(apply(LogConfig{}).has_value());
    fs::remove_all(test_dir_);
  }

  fs::path test_dir_;
};

TEST_F(ConfigFileTest, LoadFromFile) {
  auto path = write_file(test_dir_ / "tasks.yaml", R"(
tasks:
  - name: a
    cmd: "true"
    cwd: /tmp
)");
  auto r = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->tasks.size(), 1u);
  EXPECT_EQ(r->tasks[0].cmd, "true");
}

TEST_F(ConfigFileTest, ApplyLogConfig_WritesToFile) {
  auto log_path = test_dir_ / "proctask.log";
  ASSERT_TRUE(apply({.level = "debug", .file = log_path.string()}).has_value());
  EXPECT_EQ(log::logger().level(), log::Level::Debug);

  log::info("hello from {}", "config_test");
  auto content = read_file(log_path);
  EXPECT_NE(content.find("hello from config_test"), std::string::npos);
  EXPECT_NE(content.find("[info]"), std::string::npos);
}

TEST_F(ConfigFileTest, ApplyLogConfig_UnwritableFile_Fails) {
  auto r = apply({.level = "info", .file = (test_dir_ / "missing" / "x.log").string()});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileNotFound));
}

TEST(ErrorCategoryTest, MessagesCoverEveryCode) {
  EXPECT_STREQ(error_category().name(), "proctask");
  EXPECT_EQ(make_error_code(Error::ParseError).message(), "parse error");
  EXPECT_EQ(make_error_code(Error::InvalidState).message(),
            "operation not valid in current task state");
  EXPECT_EQ(error_category().message(static_cast<int>(Error::ParseError) + 1),
            "unknown error");
}
