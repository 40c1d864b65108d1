/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <vector>

#include "common/cmp.hpp"

namespace lc {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void copy(Bytes &l, BytesIn r) {
    l.assign(r.begin(), r.end());
  }

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace lc
