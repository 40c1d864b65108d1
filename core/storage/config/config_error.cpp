/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lc::storage::config, ConfigError, e) {
  using lc::storage::config::ConfigError;

  switch (e) {
    case (ConfigError::kJSONParserError):
      return "ConfigError: JSON parser error";
    case (ConfigError::kBadPath):
      return "ConfigError: config key is wrong";
    case (ConfigError::kBadValue):
      return "ConfigError: config value has wrong type";
    case (ConfigError::kCannotOpenFile):
      return "ConfigError: cannot open file";
    default:
      return "ConfigError: unknown error";
  }
}
