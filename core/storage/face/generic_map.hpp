/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/map_cursor.hpp"
#include "storage/face/readable_map.hpp"
#include "storage/face/writeable_map.hpp"

namespace lc::storage::face {

  /**
   * @brief An abstraction over readable, writeable, iterable key-value map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct GenericMap : virtual public IterableMap<K, V>,
                      virtual public ReadableMap<K, V>,
                      virtual public WriteableMap<K, V> {};

}  // namespace lc::storage::face
