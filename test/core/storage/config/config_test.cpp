/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/config/config.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>

#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using lc::storage::config::Config;
using lc::storage::config::ConfigError;
using lc::storage::config::kGasLimit;
using lc::storage::config::kLogLevel;
using lc::storage::config::kMapRoot;
using lc::storage::config::kStoragePath;

class ConfigTest : public test::BaseFS_Test {
 public:
  ConfigTest() : test::BaseFS_Test("lc_config_test") {}

  /// Creates file in test directory with given content
  std::string writeFile(const std::string &name, const std::string &content) {
    auto path{createFile(name)};
    boost::filesystem::ofstream file{path};
    file << content;
    return fs::canonical(path).string();
  }

  Config config{};
};

/**
 * @given path to a file not exists
 * @when try to load file not exists
 * @then ConfigError::kCannotOpenFile returned
 */
TEST_F(ConfigTest, FileNotFound) {
  EXPECT_OUTCOME_ERROR(ConfigError::kCannotOpenFile,
                       config.load("/not/exists/file/config"));
}

/**
 * @given an empty file and a file with invalid JSON
 * @when load them
 * @then kJSONParserError returned
 */
TEST_F(ConfigTest, InvalidFile) {
  EXPECT_OUTCOME_ERROR(ConfigError::kJSONParserError,
                       config.load(writeFile("empty.json", "")));
  EXPECT_OUTCOME_ERROR(
      ConfigError::kJSONParserError,
      config.load(writeFile("wrong.json", "not a valid JSON content")));
}

/**
 * @given loaded JSON config
 * @when read existing key, missing key, and key of wrong type
 * @then value, kBadPath and kBadValue
 */
TEST_F(ConfigTest, Get) {
  EXPECT_OUTCOME_TRUE_1(config.load(writeFile(
      "config.json", R"({"map": {"root": "accounts", "size": "x"}})")));
  EXPECT_OUTCOME_EQ(config.get<std::string>(kMapRoot), "accounts");
  EXPECT_OUTCOME_ERROR(ConfigError::kBadPath, config.get<int>("not.exists"));
  EXPECT_OUTCOME_ERROR(ConfigError::kBadValue, config.get<int>("map.size"));
}

/**
 * @given default config
 * @when read known keys
 * @then defaults are returned
 */
TEST_F(ConfigTest, Defaults) {
  auto defaults{Config::defaults()};
  EXPECT_OUTCOME_EQ(defaults.get<std::string>(kStoragePath), "ledger");
  EXPECT_OUTCOME_EQ(defaults.get<std::string>(kMapRoot), "state/map");
  EXPECT_OUTCOME_EQ(defaults.get<uint64_t>(kGasLimit), 0u);
  EXPECT_OUTCOME_EQ(defaults.get<std::string>(kLogLevel), "info");
}

/**
 * @given default config
 * @when load file with some keys
 * @then loaded keys override defaults, other defaults are kept
 */
TEST_F(ConfigTest, LoadOverridesDefaults) {
  auto cfg{Config::defaults()};
  EXPECT_OUTCOME_TRUE_1(cfg.load(writeFile(
      "config.json", R"({"gas": {"limit": "5000"}, "extra": {"a": "1"}})")));
  EXPECT_OUTCOME_EQ(cfg.get<uint64_t>(kGasLimit), 5000u);
  EXPECT_OUTCOME_EQ(cfg.get<std::string>(kMapRoot), "state/map");
  EXPECT_OUTCOME_EQ(cfg.get<int>("extra.a"), 1);
}

/**
 * @given a config with values
 * @when save it and load into another config
 * @then values are the same
 */
TEST_F(ConfigTest, SaveLoad) {
  auto filename = getPathString() + "/saved.json";

  EXPECT_OUTCOME_TRUE_1(config.set<std::string>(kMapRoot, "a/b"));
  EXPECT_OUTCOME_TRUE_1(config.set<uint64_t>(kGasLimit, 42));
  EXPECT_OUTCOME_TRUE_1(config.set("flag", true));
  EXPECT_OUTCOME_TRUE_1(config.save(filename));

  Config loaded;
  EXPECT_OUTCOME_TRUE_1(loaded.load(filename));
  EXPECT_OUTCOME_EQ(loaded.get<std::string>(kMapRoot), "a/b");
  EXPECT_OUTCOME_EQ(loaded.get<uint64_t>(kGasLimit), 42u);
  EXPECT_OUTCOME_EQ(loaded.get<bool>("flag"), true);
}

/**
 * @given a config and a invalid file path
 * @when save is called with invalid path
 * @then kCannotOpenFile
 */
TEST_F(ConfigTest, SaveInvalidPath) {
  EXPECT_OUTCOME_ERROR(ConfigError::kCannotOpenFile,
                       config.save("/not/exists/dir/config.json"));
}
