/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/optional.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "storage/key/key.hpp"

namespace lc::storage::face {
  /// Raw key string form and raw value bytes of a scanned entry
  using KeyValue = std::pair<std::string, Bytes>;

  /**
   * @brief Backend managed cursor of a prefix scan.
   * Opaque to callers, only the storage that created it may advance it.
   */
  struct PrefixIter {
    virtual ~PrefixIter() = default;
  };

  using PrefixIterPtr = std::unique_ptr<PrefixIter>;

  /**
   * @brief Read access to ledger storage.
   * Every call is one synchronous conversation with the backend.
   */
  struct StorageRead {
    virtual ~StorageRead() = default;

    /**
     * @brief Read raw value
     * @param key - storage key
     * @return value bytes, none if key is absent, or backend error
     */
    virtual outcome::result<boost::optional<Bytes>> readBytes(
        const Key &key) const = 0;

    virtual outcome::result<bool> hasKey(const Key &key) const = 0;

    /**
     * @brief Open a scan over all keys below prefix
     * @param prefix - parent key, itself is not visited
     * @return cursor to pass to iterNext
     */
    virtual outcome::result<PrefixIterPtr> iterPrefix(
        const Key &prefix) const = 0;

    /**
     * @brief Advance a prefix scan by exactly one entry
     * @param iter - cursor created by iterPrefix of this storage
     * @return next entry, or none at end of data
     */
    virtual outcome::result<boost::optional<KeyValue>> iterNext(
        PrefixIter &iter) const = 0;
  };

  /**
   * @brief Write access to ledger storage.
   */
  struct StorageWrite {
    virtual ~StorageWrite() = default;

    /// Write raw value, overwriting the previous one
    virtual outcome::result<void> writeBytes(const Key &key,
                                             BytesIn value) = 0;

    /// Delete value, absent key is not an error
    virtual outcome::result<void> remove(const Key &key) = 0;
  };

  struct Storage : virtual public StorageRead, virtual public StorageWrite {};
}  // namespace lc::storage::face
