/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace lc::storage {

  /**
   * @brief Errors of backends without a native error model
   */
  enum class StorageError {
    kNotFound = 1,
    kForeignIterator,
  };

}  // namespace lc::storage

OUTCOME_HPP_DECLARE_ERROR(lc::storage, StorageError);
