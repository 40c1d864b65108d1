/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/in_memory_cursor.hpp"
#include "storage/storage_error.hpp"

namespace lc::storage {

  outcome::result<Bytes> InMemoryStorage::get(const Bytes &key) const {
    auto it{storage.find(key)};
    if (it != storage.end()) {
      return it->second;
    }
    return StorageError::kNotFound;
  }

  outcome::result<boost::optional<Bytes>> InMemoryStorage::tryGet(
      const Bytes &key) const {
    auto it{storage.find(key)};
    if (it != storage.end()) {
      return boost::make_optional(it->second);
    }
    return boost::none;
  }

  outcome::result<void> InMemoryStorage::put(const Bytes &key,
                                             const Bytes &value) {
    storage[key] = value;
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::put(const Bytes &key, Bytes &&value) {
    storage[key] = std::move(value);
    return outcome::success();
  }

  bool InMemoryStorage::contains(const Bytes &key) const {
    return storage.find(key) != storage.end();
  }

  outcome::result<void> InMemoryStorage::remove(const Bytes &key) {
    storage.erase(key);
    return outcome::success();
  }

  std::unique_ptr<BufferMapCursor> InMemoryStorage::cursor() {
    return std::make_unique<InMemoryCursor>(shared_from_this());
  }

  size_t InMemoryStorage::size() const {
    return storage.size();
  }
}  // namespace lc::storage
