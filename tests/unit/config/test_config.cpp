#include <gtest/gtest.h>

#include <fstream>

#include "snip/config/config.hpp"
#include "test_helpers.hpp"

using namespace snip::config;
using namespace snip::test;
using snip::ErrorCode;

class ConfigTest : public TempDirTest {
protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  Config config;
  EXPECT_FALSE(config.database.empty());
  EXPECT_EQ(config.database.filename(), "snip.sqlite3");
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_FALSE(config.log_file.has_value());
  EXPECT_EQ(config.attachments.max_size, 100u * 1024 * 1024);
  EXPECT_EQ(config.performance.sqlite_journal_mode, "WAL");
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadOverridesValues) {
  auto path = writeConfig(R"(
database = "/tmp/snips/custom.sqlite3"
log_level = "debug"
log_file = "/tmp/snips/snip.log"

[attachments]
max_size = 2048

[performance]
sqlite_journal_mode = "DELETE"
sqlite_synchronous = "FULL"
busy_timeout_ms = 250
)");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->database, "/tmp/snips/custom.sqlite3");
  EXPECT_EQ(config->log_level, "debug");
  ASSERT_TRUE(config->log_file.has_value());
  EXPECT_EQ(*config->log_file, "/tmp/snips/snip.log");
  EXPECT_EQ(config->attachments.max_size, 2048u);
  EXPECT_EQ(config->performance.sqlite_journal_mode, "DELETE");
  EXPECT_EQ(config->performance.sqlite_synchronous, "FULL");
  EXPECT_EQ(config->performance.busy_timeout_ms, 250);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  auto path = writeConfig("log_level = \"error\"\n");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->log_level, "error");
  EXPECT_EQ(config->performance.sqlite_synchronous, "NORMAL");
  EXPECT_EQ(config->attachments.max_size, 100u * 1024 * 1024);
}

TEST_F(ConfigTest, MissingExplicitFileIsError) {
  EXPECT_ERROR(Config::fromFile(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedTomlIsError) {
  auto path = writeConfig("log_level = \"unterminated\n[attachments\n");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
  EXPECT_ERROR(Config::fromFile(writeConfig("log_level = \"loud\"\n")), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromFile(writeConfig("[performance]\nsqlite_journal_mode = \"FAST\"\n")),
               ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromFile(writeConfig("[performance]\nsqlite_synchronous = \"maybe\"\n")),
               ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromFile(writeConfig("[performance]\nbusy_timeout_ms = -5\n")),
               ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromFile(writeConfig("[attachments]\nmax_size = -1\n")),
               ErrorCode::kConfigError);
}
