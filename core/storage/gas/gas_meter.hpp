/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "storage/gas/gas_error.hpp"

namespace lc::storage::gas {
  using GasAmount = uint64_t;

  /**
   * @brief Accumulates gas used by storage access against a fixed limit.
   * Once a charge exceeds the limit the meter stays saturated.
   */
  class GasMeter {
   public:
    explicit GasMeter(GasAmount limit);

    /**
     * @brief Add amount to used gas
     * @return kOutOfGas if used gas would exceed the limit
     */
    outcome::result<void> charge(GasAmount amount);

    GasAmount used() const;

    GasAmount remaining() const;

    GasAmount limit() const;

   private:
    GasAmount limit_;
    GasAmount used_{0};
  };
}  // namespace lc::storage::gas
