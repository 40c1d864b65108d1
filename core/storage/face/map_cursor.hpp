/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/outcome.hpp"

namespace lc::storage::face {

  /**
   * @brief An abstraction over generic map cursor.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /**
     * @brief Same as std::begin(...);
     */
    virtual void seekToFirst() = 0;

    /**
     * @brief Seek to the first key not less than given key.
     */
    virtual void seek(const K &key) = 0;

    /**
     * @brief Same as std::rbegin(...);, e.g. points to the last valid element
     */
    virtual void seekToLast() = 0;

    /**
     * @brief Is iterator valid?
     * @return true if iterator points to the element of map, false otherwise
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Make step forward.
     */
    virtual void next() = 0;

    /**
     * @brief Make step backwards.
     */
    virtual void prev() = 0;

    virtual K key() const = 0;

    virtual V value() const = 0;

    /**
     * @brief Error that stopped the cursor, if any.
     * A cursor which became invalid because of an error reports it here.
     */
    virtual outcome::result<void> status() const = 0;
  };

  /**
   * @brief Map which can open cursors over its bindings.
   * New cursor is not positioned, call one of seek methods first.
   */
  template <typename K, typename V>
  struct IterableMap {
    virtual ~IterableMap() = default;

    virtual std::unique_ptr<MapCursor<K, V>> cursor() = 0;
  };

}  // namespace lc::storage::face
