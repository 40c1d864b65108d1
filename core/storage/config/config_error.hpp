/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace lc::storage::config {

  /**
   * @brief Config returns these types of errors
   */
  enum class ConfigError {
    kJSONParserError = 1,
    kBadPath,
    kBadValue,
    kCannotOpenFile,
  };

}  // namespace lc::storage::config

OUTCOME_HPP_DECLARE_ERROR(lc::storage::config, ConfigError);
