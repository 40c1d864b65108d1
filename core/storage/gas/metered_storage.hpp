/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/logger.hpp"
#include "storage/face/storage.hpp"
#include "storage/gas/gas_meter.hpp"
#include "storage/gas/pricelist.hpp"

namespace lc::storage::gas {
  /**
   * @brief Storage which charges gas for every access to underlying storage.
   * Access is charged before it is performed, value size after.
   */
  class MeteredStorage : public face::Storage {
   public:
    MeteredStorage(std::shared_ptr<face::Storage> storage,
                   std::shared_ptr<GasMeter> meter,
                   Pricelist pricelist = {});

    outcome::result<boost::optional<Bytes>> readBytes(
        const Key &key) const override;

    outcome::result<bool> hasKey(const Key &key) const override;

    outcome::result<face::PrefixIterPtr> iterPrefix(
        const Key &prefix) const override;

    outcome::result<boost::optional<face::KeyValue>> iterNext(
        face::PrefixIter &iter) const override;

    outcome::result<void> writeBytes(const Key &key, BytesIn value) override;

    outcome::result<void> remove(const Key &key) override;

    const GasMeter &meter() const;

   private:
    outcome::result<void> charge(GasAmount amount) const;

    std::shared_ptr<face::Storage> storage_;
    std::shared_ptr<GasMeter> meter_;
    Pricelist pricelist_;
    mutable bool exhausted_{false};
    common::Logger logger_ = common::createLogger("gas");
  };
}  // namespace lc::storage::gas
