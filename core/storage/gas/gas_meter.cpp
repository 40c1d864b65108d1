/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/gas/gas_meter.hpp"

namespace lc::storage::gas {
  GasMeter::GasMeter(GasAmount limit) : limit_{limit} {}

  outcome::result<void> GasMeter::charge(GasAmount amount) {
    if (amount > remaining()) {
      used_ = limit_;
      return GasError::kOutOfGas;
    }
    used_ += amount;
    return outcome::success();
  }

  GasAmount GasMeter::used() const {
    return used_;
  }

  GasAmount GasMeter::remaining() const {
    return limit_ - used_;
  }

  GasAmount GasMeter::limit() const {
    return limit_;
  }
}  // namespace lc::storage::gas
