/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/gas/gas_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lc::storage::gas, GasError, e) {
  using lc::storage::gas::GasError;
  switch (e) {
    case GasError::kOutOfGas:
      return "GasError: out of gas";
    default:
      return "GasError: unknown error";
  }
}
