/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

#include "storage/gas/gas_meter.hpp"

namespace lc::storage::gas {
  /**
   * @brief Gas cost of storage primitives
   */
  struct Pricelist {
    inline GasAmount bytes(size_t size) const {
      return per_byte * size;
    }
    inline GasAmount onRead(size_t key_size) const {
      return read_base + bytes(key_size);
    }
    inline GasAmount onReadValue(size_t value_size) const {
      return bytes(value_size);
    }
    inline GasAmount onHasKey(size_t key_size) const {
      return has_key_base + bytes(key_size);
    }
    inline GasAmount onWrite(size_t key_size, size_t value_size) const {
      return write_base + bytes(key_size + value_size);
    }
    inline GasAmount onDelete(size_t key_size) const {
      return delete_base + bytes(key_size);
    }
    inline GasAmount onIterPrefix(size_t prefix_size) const {
      return iter_prefix_base + bytes(prefix_size);
    }
    inline GasAmount onIterNext() const {
      return iter_next_base;
    }
    inline GasAmount onIterEntry(size_t key_size, size_t value_size) const {
      return bytes(key_size + value_size);
    }

    GasAmount per_byte{1};
    GasAmount read_base{100};
    GasAmount has_key_base{100};
    GasAmount write_base{200};
    GasAmount delete_base{100};
    GasAmount iter_prefix_base{150};
    GasAmount iter_next_base{50};
  };
}  // namespace lc::storage::gas
