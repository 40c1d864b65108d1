/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lc::codec::cbor, CborEncodeError, e) {
  using lc::codec::cbor::CborEncodeError;
  switch (e) {
    case CborEncodeError::kExpectedMapValueSingle:
      return "Expected map value single";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(lc::codec::cbor, CborDecodeError, e) {
  using lc::codec::cbor::CborDecodeError;
  switch (e) {
    case CborDecodeError::kInvalidCbor:
      return "Invalid CBOR";
    case CborDecodeError::kWrongType:
      return "Wrong type";
    case CborDecodeError::kIntOverflow:
      return "Int overflow";
    case CborDecodeError::kWrongSize:
      return "Wrong size";
    case CborDecodeError::kKeyNotFound:
      return "Map key not found";
    case CborDecodeError::kTrailingBytes:
      return "Trailing bytes after decoded value";
    default:
      return "Unknown error";
  }
}
