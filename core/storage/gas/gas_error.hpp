/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace lc::storage::gas {

  enum class GasError {
    kOutOfGas = 1,
  };

}  // namespace lc::storage::gas

OUTCOME_HPP_DECLARE_ERROR(lc::storage::gas, GasError);
