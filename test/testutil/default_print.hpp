/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest-printers.h>
#include <boost/optional.hpp>

namespace boost {
  template <typename T>
  void PrintTo(const optional<T> &v, ::std::ostream *os) {
    if (v) {
      *os << ::testing::PrintToString(*v);
    } else {
      *os << "none";
    }
  }
}  // namespace boost
