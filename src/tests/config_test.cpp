#include <gtest/gtest.h>
#include <filesystem>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace distore::config;

class ConfigTest : public ::testing::Test {
protected:
  TempDir dir{"config_test"};
  std::filesystem::path file;

  void SetUp() override {
    init_test_logging();
    file = Config::file_in(dir.path());
  }
};

TEST_F(ConfigTest, MissingFileIsEmptyConfiguration) {
  Config config(file);
  EXPECT_FALSE(config.resolve("container", "/home/user").has_value());
  EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(ConfigTest, FileLivesInDistoreSubdirectory) {
  EXPECT_EQ(file, dir.path() / "distore" / "distore.ini");
}

TEST_F(ConfigTest, ScopedValueOverridesGlobal) {
  Config config(file);
  config.set("container", "global-container");
  config.set("container", "project-container", std::string("/home/user/project"));

  EXPECT_EQ(config.resolve("container", "/home/user/project"), "project-container");
  EXPECT_EQ(config.resolve("container", "/somewhere/else"), "global-container");
  EXPECT_EQ(config.global_value("container"), "global-container");
}

TEST_F(ConfigTest, ValuesPersistAcrossInstances) {
  {
    Config config(file);
    config.set("store", "/data/store");
    config.set("container", "photos", std::string("/home/user/pictures.2024"));
  }

  Config reloaded(file);
  EXPECT_EQ(reloaded.global_value("store"), "/data/store");
  EXPECT_EQ(reloaded.scoped_value("container", "/home/user/pictures.2024"), "photos");
  // Scoped lookup falls back to the global store
  EXPECT_EQ(reloaded.resolve("store", "/home/user/pictures.2024"), "/data/store");
}

TEST_F(ConfigTest, OverwritesExistingValue) {
  Config config(file);
  config.set("container", "one");
  config.set("container", "two");
  config.set("container", "a", std::string("/p"));
  config.set("container", "b", std::string("/p"));

  Config reloaded(file);
  EXPECT_EQ(reloaded.global_value("container"), "two");
  EXPECT_EQ(reloaded.scoped_value("container", "/p"), "b");
}

TEST_F(ConfigTest, RejectsUnknownKeys) {
  Config config(file);
  EXPECT_THROW(config.set("colour", "blue"), ConfigError);
  EXPECT_THROW(config.resolve("colour", "/p"), ConfigError);
  EXPECT_TRUE(Config::is_known_key("store"));
  EXPECT_FALSE(Config::is_known_key("colour"));
}

TEST_F(ConfigTest, UnparsableFileIsConfigError) {
  std::filesystem::create_directories(file.parent_path());
  write_test_file(file, "[unterminated\nkey=value\n");
  EXPECT_THROW(Config config(file), ConfigError);
}
