/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lc::storage, StorageError, e) {
  using lc::storage::StorageError;
  switch (e) {
    case StorageError::kNotFound:
      return "StorageError: key not found";
    case StorageError::kForeignIterator:
      return "StorageError: iterator was created by another storage";
    default:
      return "StorageError: unknown error";
  }
}
