/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/leveldb/leveldb_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lc::storage, LevelDBError, e) {
  using lc::storage::LevelDBError;
  switch (e) {
    case LevelDBError::kOk:
      return "success";
    case LevelDBError::kNotFound:
      return "LevelDBError: key not found";
    case LevelDBError::kCorruption:
      return "LevelDBError: data corruption";
    case LevelDBError::kNotSupported:
      return "LevelDBError: operation is not supported";
    case LevelDBError::kInvalidArgument:
      return "LevelDBError: invalid argument";
    case LevelDBError::kIOError:
      return "LevelDBError: IO error";
    case LevelDBError::kUnknown:
      break;
  }
  return "LevelDBError: unknown error";
}
