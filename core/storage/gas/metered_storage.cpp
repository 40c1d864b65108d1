/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/gas/metered_storage.hpp"

namespace lc::storage::gas {
  MeteredStorage::MeteredStorage(std::shared_ptr<face::Storage> storage,
                                 std::shared_ptr<GasMeter> meter,
                                 Pricelist pricelist)
      : storage_{std::move(storage)},
        meter_{std::move(meter)},
        pricelist_{pricelist} {}

  outcome::result<void> MeteredStorage::charge(GasAmount amount) const {
    auto remaining{meter_->remaining()};
    auto res{meter_->charge(amount)};
    if (!res && !exhausted_) {
      exhausted_ = true;
      logger_->warn("out of gas, charged {} with {} remaining of {}",
                    amount,
                    remaining,
                    meter_->limit());
    }
    return res;
  }

  outcome::result<boost::optional<Bytes>> MeteredStorage::readBytes(
      const Key &key) const {
    auto key_size{key.toString().size()};
    OUTCOME_TRY(charge(pricelist_.onRead(key_size)));
    OUTCOME_TRY(value, storage_->readBytes(key));
    if (value) {
      OUTCOME_TRY(charge(pricelist_.onReadValue(value->size())));
    }
    return std::move(value);
  }

  outcome::result<bool> MeteredStorage::hasKey(const Key &key) const {
    OUTCOME_TRY(charge(pricelist_.onHasKey(key.toString().size())));
    return storage_->hasKey(key);
  }

  outcome::result<face::PrefixIterPtr> MeteredStorage::iterPrefix(
      const Key &prefix) const {
    OUTCOME_TRY(charge(pricelist_.onIterPrefix(prefix.toString().size())));
    return storage_->iterPrefix(prefix);
  }

  outcome::result<boost::optional<face::KeyValue>> MeteredStorage::iterNext(
      face::PrefixIter &iter) const {
    OUTCOME_TRY(charge(pricelist_.onIterNext()));
    OUTCOME_TRY(entry, storage_->iterNext(iter));
    if (entry) {
      OUTCOME_TRY(charge(
          pricelist_.onIterEntry(entry->first.size(), entry->second.size())));
    }
    return std::move(entry);
  }

  outcome::result<void> MeteredStorage::writeBytes(const Key &key,
                                                   BytesIn value) {
    OUTCOME_TRY(
        charge(pricelist_.onWrite(key.toString().size(), value.size())));
    return storage_->writeBytes(key, value);
  }

  outcome::result<void> MeteredStorage::remove(const Key &key) {
    OUTCOME_TRY(charge(pricelist_.onDelete(key.toString().size())));
    return storage_->remove(key);
  }

  const GasMeter &MeteredStorage::meter() const {
    return *meter_;
  }
}  // namespace lc::storage::gas
