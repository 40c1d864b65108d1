/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace lc::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Extra sink attached to every logger created after it is set
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Set level of every registered logger
   * @param level - spdlog level name ("trace", "debug", "info", ...)
   * @return false if level name is unknown
   */
  bool setLogLevel(const std::string &level);
}  // namespace lc::common
