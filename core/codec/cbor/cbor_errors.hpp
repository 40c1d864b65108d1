/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace lc::codec::cbor {
  enum class CborEncodeError { kExpectedMapValueSingle = 1 };

  enum class CborDecodeError {
    kInvalidCbor = 1,
    kWrongType,
    kIntOverflow,
    kWrongSize,
    kKeyNotFound,
    kTrailingBytes,
  };
}  // namespace lc::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(lc::codec::cbor, CborEncodeError);
OUTCOME_HPP_DECLARE_ERROR(lc::codec::cbor, CborDecodeError);
