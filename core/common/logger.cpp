/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lc::common {
  spdlog::sink_ptr file_sink;

  namespace {
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink() {
      static auto sink{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    std::vector<spdlog::sink_ptr> sinks{console_sink()};
    if (file_sink) {
      sinks.push_back(file_sink);
    }
    auto logger{
        std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end())};
    logger->set_level(spdlog::get_level());
    // another thread may have registered the same tag meanwhile
    try {
      spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex &) {
      return spdlog::get(tag);
    }
    return logger;
  }

  bool setLogLevel(const std::string &level) {
    const auto parsed{spdlog::level::from_str(level)};
    if (parsed == spdlog::level::off && level != "off") {
      return false;
    }
    spdlog::set_level(parsed);
    return true;
  }
}  // namespace lc::common
