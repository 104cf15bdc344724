#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

#include "test_helpers.hpp"
#include "tuid/config/config.hpp"
#include "tuid/util/logging.hpp"
#include "tuid/util/xdg.hpp"

using namespace tuid::util;

class XdgTest : public tuid::test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    saveEnv("XDG_CONFIG_HOME", saved_config_home_);
    saveEnv("XDG_DATA_HOME", saved_data_home_);
  }

  void TearDown() override {
    restoreEnv("XDG_CONFIG_HOME", saved_config_home_);
    restoreEnv("XDG_DATA_HOME", saved_data_home_);
    TempDirTest::TearDown();
  }

 private:
  static void saveEnv(const char* name, std::optional<std::string>& slot) {
    const char* value = std::getenv(name);
    if (value) slot = value;
  }

  static void restoreEnv(const char* name, const std::optional<std::string>& slot) {
    if (slot) {
      setenv(name, slot->c_str(), 1);
    } else {
      unsetenv(name);
    }
  }

  std::optional<std::string> saved_config_home_;
  std::optional<std::string> saved_data_home_;
};

TEST_F(XdgTest, HonoursXdgVariables) {
  setenv("XDG_CONFIG_HOME", (temp_dir_ / "cfg").string().c_str(), 1);
  setenv("XDG_DATA_HOME", (temp_dir_ / "share").string().c_str(), 1);

  EXPECT_EQ(Xdg::configHome().string(), (temp_dir_ / "cfg" / "tuid").string());
  EXPECT_EQ(Xdg::configFile().string(), (temp_dir_ / "cfg" / "tuid" / "config.toml").string());
  EXPECT_EQ(Xdg::dataHome().string(), (temp_dir_ / "share" / "tuid").string());
  EXPECT_EQ(defaultLogFile().string(), (temp_dir_ / "share" / "tuid" / "logs" / "tuid.log").string());
  EXPECT_EQ(tuid::config::Config::defaultConfigPath().string(), Xdg::configFile().string());
}

TEST_F(XdgTest, FallsBackToHomeDirectories) {
  unsetenv("XDG_CONFIG_HOME");
  unsetenv("XDG_DATA_HOME");

  const char* home = std::getenv("HOME");
  if (!home || std::string(home).empty()) {
    GTEST_SKIP() << "HOME is not set";
  }

  EXPECT_EQ(Xdg::configHome().string(),
            (std::filesystem::path(home) / ".config" / "tuid").string());
  EXPECT_EQ(Xdg::dataHome().string(),
            (std::filesystem::path(home) / ".local" / "share" / "tuid").string());
}
