#include <gtest/gtest.h>

#include "objid/config/config.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace objid::config;
using namespace objid::test;
using objid::ErrorCode;

class ConfigTest : public ::testing::Test {
 protected:
  TempDirectory temp_dir_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.logging.level, spdlog::level::info);
  EXPECT_FALSE(config.logging.file.has_value());
  EXPECT_FALSE(config.identity.overridden());
  EXPECT_FALSE(config.counter_seed.has_value());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadFromString) {
  auto result = Config::fromString(R"(
[logging]
level = "debug"
max_files = 5

[identity]
hostname = "build-01"
pid = 4242

[counter]
seed = 17
)");

  ASSERT_OK(result);
  EXPECT_EQ(result->logging.level, spdlog::level::debug);
  EXPECT_EQ(result->logging.max_files, 5u);
  EXPECT_EQ(result->identity.hostname, "build-01");
  EXPECT_EQ(result->identity.pid, 4242u);
  EXPECT_EQ(result->counter_seed, 17u);
}

TEST_F(ConfigTest, MakeGeneratorHonorsOverrides) {
  auto config = Config::fromString(R"(
[identity]
hostname = "build-01"
pid = 70000

[counter]
seed = 256
)");
  ASSERT_OK(config);

  auto generator = config->makeGenerator();
  auto id = generator->generate();

  EXPECT_EQ(id.toHex().substr(8), "979a54" "1170" "000100");
  EXPECT_EQ(generator->machineBytes(), objid::core::machineBytesFor("build-01"));
}

TEST_F(ConfigTest, MakeGeneratorWithoutOverrides) {
  Config config;
  config.counter_seed = 3;

  auto generator = config.makeGenerator();
  EXPECT_EQ(generator->nextCounter(), 3u);
}

TEST_F(ConfigTest, LoadFromFile) {
  auto path = temp_dir_.writeFile("objid.toml", "[counter]\nseed = 99\n");

  auto result = Config::fromFile(path);
  ASSERT_OK(result);
  EXPECT_EQ(result->counter_seed, 99u);
}

TEST_F(ConfigTest, MissingFile) {
  EXPECT_ERROR(Config::fromFile(temp_dir_.path() / "missing.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedToml) {
  EXPECT_ERROR(Config::fromString("[logging\nlevel = "), ErrorCode::kConfigError);

  auto path = temp_dir_.writeFile("broken.toml", "seed = = 1\n");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, OutOfRangeValues) {
  EXPECT_ERROR(Config::fromString("[counter]\nseed = 16777216\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromString("[counter]\nseed = -1\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromString("[identity]\npid = -5\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromString("[logging]\nlevel = \"loud\"\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::fromString("[logging]\nmax_file_size = 0\n"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ValidateRejectsEmptyHostname) {
  Config config;
  config.identity.hostname = "";

  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  config.logging.level = spdlog::level::warn;
  config.identity.hostname = "saved-host";
  config.identity.pid = 12;
  config.counter_seed = 4096;

  auto path = temp_dir_.path() / "nested" / "objid.toml";
  ASSERT_OK(config.save(path));

  auto reloaded = Config::fromFile(path);
  ASSERT_OK(reloaded);
  EXPECT_EQ(reloaded->logging.level, spdlog::level::warn);
  EXPECT_EQ(reloaded->identity.hostname, "saved-host");
  EXPECT_EQ(reloaded->identity.pid, 12u);
  EXPECT_EQ(reloaded->counter_seed, 4096u);
}

TEST_F(ConfigTest, LoggingWithFileSink) {
  Config config;
  config.logging.level = spdlog::level::debug;
  config.logging.file = temp_dir_.path() / "logs" / "objid.log";

  ASSERT_OK(objid::util::Logging::initialize(config.logging));

  auto generator = config.makeGenerator();
  ASSERT_NE(generator, nullptr);
  objid::util::Logging::logger()->flush();

  EXPECT_NE(temp_dir_.readFile("logs/objid.log").find("ObjectId generator ready"),
            std::string::npos);

  // Back to stderr only so later tests do not write into the removed directory
  ASSERT_OK(objid::util::Logging::initialize(objid::util::LoggingConfig{}));
}

TEST_F(ConfigTest, ParseLevel) {
  EXPECT_EQ(objid::util::Logging::parseLevel("trace").value(), spdlog::level::trace);
  EXPECT_EQ(objid::util::Logging::parseLevel("warning").value(), spdlog::level::warn);
  EXPECT_EQ(objid::util::Logging::parseLevel("off").value(), spdlog::level::off);
  EXPECT_ERROR(objid::util::Logging::parseLevel("verbose"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ApplyToProcessInstallsDefault) {
  // The only test in this binary that touches the process-default generator
  auto config = Config::fromString("[identity]\nhostname = \"applied-host\"\npid = 7\n");
  ASSERT_OK(config);

  ASSERT_OK(config->applyToProcess());

  auto id = objid::core::ObjectId::generate();
  EXPECT_EQ(id.machineBytes(), objid::core::machineBytesFor("applied-host"));
  EXPECT_EQ(id.processId(), 7);

  // Installing twice is rejected
  EXPECT_ERROR(config->applyToProcess(), ErrorCode::kInvalidState);
}
