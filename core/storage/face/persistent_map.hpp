/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/generic_map.hpp"

namespace lc::storage::face {

  /**
   * @brief An abstraction over a map accessible via filesystem or remote
   * connection, which outlives the process.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct PersistentMap : public GenericMap<K, V> {};

}  // namespace lc::storage::face
