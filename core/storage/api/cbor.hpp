/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_codec.hpp"
#include "storage/face/storage.hpp"

namespace lc::storage {
  /**
   * @brief Read and decode value
   * @return decoded value, none if key is absent, backend or decode error
   */
  template <typename T>
  outcome::result<boost::optional<T>> tryGetCbor(
      const face::StorageRead &storage, const Key &key) {
    OUTCOME_TRY(bytes, storage.readBytes(key));
    if (!bytes) {
      return boost::none;
    }
    OUTCOME_TRY(value, codec::cbor::decode<T>(*bytes));
    return boost::make_optional(std::move(value));
  }

  /**
   * @brief Encode and write value
   */
  template <typename T>
  outcome::result<void> setCbor(face::StorageWrite &storage,
                                const Key &key,
                                const T &value) {
    OUTCOME_TRY(bytes, codec::cbor::encode(value));
    return storage.writeBytes(key, bytes);
  }
}  // namespace lc::storage
