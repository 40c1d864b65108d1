/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using lc::common::createLogger;
using lc::common::file_sink;
using lc::common::setLogLevel;

struct LoggerTest : public ::testing::Test {
  void TearDown() override {
    file_sink.reset();
    setLogLevel("info");
  }
};

/**
 * @given logger created for tag
 * @when create logger with same tag again
 * @then same logger is returned
 */
TEST_F(LoggerTest, SameTagSameLogger) {
  auto first{createLogger("logger_test_same")};
  auto second{createLogger("logger_test_same")};
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->name(), "logger_test_same");
}

/**
 * @given shared sink set
 * @when logger created after it writes
 * @then message reaches the sink
 */
TEST_F(LoggerTest, SharedSink) {
  std::ostringstream out;
  file_sink = std::make_shared<spdlog::sinks::ostream_sink_st>(out);
  auto log{createLogger("logger_test_sink")};
  log->warn("gas exhausted {}", 42);
  log->flush();
  EXPECT_NE(out.str().find("gas exhausted 42"), std::string::npos);
}

/// Level names are validated and applied to existing loggers
TEST_F(LoggerTest, SetLevel) {
  auto log{createLogger("logger_test_level")};
  EXPECT_TRUE(setLogLevel("debug"));
  EXPECT_EQ(log->level(), spdlog::level::debug);
  EXPECT_TRUE(setLogLevel("off"));
  EXPECT_EQ(log->level(), spdlog::level::off);
  EXPECT_FALSE(setLogLevel("loud"));
  EXPECT_EQ(log->level(), spdlog::level::off);
}
