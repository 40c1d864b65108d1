/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/outcome.hpp"

namespace lc::storage::face {

  /**
   * @brief An abstraction over read-only map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct ReadableMap {
    virtual ~ReadableMap() = default;

    /**
     * @brief Get value by key
     * @param key K
     * @return V, or backend specific "not found" error if key is absent
     */
    virtual outcome::result<V> get(const K &key) const = 0;

    /**
     * @brief Get value by key
     * @param key K
     * @return V if key has value, none if not, or error
     */
    virtual outcome::result<boost::optional<V>> tryGet(const K &key) const = 0;

    /**
     * @brief Returns true if given key-value binding exists in the storage.
     * @param key K
     * @return true if key has value, false otherwise.
     */
    virtual bool contains(const K &key) const = 0;
  };

}  // namespace lc::storage::face
