/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iterator>

#include <boost/algorithm/hex.hpp>

#include "common/bytes.hpp"
#include "storage/key/key.hpp"

inline lc::Bytes operator""_unhex(const char *c, size_t s) {
  lc::Bytes bytes;
  boost::algorithm::unhex(c, c + s, std::back_inserter(bytes));
  return bytes;
}

inline lc::Bytes operator""_bytes(const char *c, size_t s) {
  return lc::Bytes(c, c + s);
}

inline lc::storage::Key operator""_key(const char *c, size_t s) {
  return lc::storage::Key::parse(std::string_view(c, s)).value();
}
