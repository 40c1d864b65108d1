/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/api/buffer_map_storage.hpp"

#include "common/span.hpp"
#include "storage/storage_error.hpp"

namespace lc::storage {
  BufferMapStorage::PrefixCursor::PrefixCursor(
      Bytes prefix, std::unique_ptr<BufferMapCursor> cursor)
      : prefix{std::move(prefix)}, cursor{std::move(cursor)} {}

  bool BufferMapStorage::PrefixCursor::isValid() const {
    if (!cursor->isValid()) {
      return false;
    }
    return startsWith(cursor->key(), prefix);
  }

  BufferMapStorage::BufferMapStorage(MapPtr map) : map_{std::move(map)} {}

  outcome::result<boost::optional<Bytes>> BufferMapStorage::readBytes(
      const Key &key) const {
    return map_->tryGet(key.toBytes());
  }

  outcome::result<bool> BufferMapStorage::hasKey(const Key &key) const {
    OUTCOME_TRY(value, map_->tryGet(key.toBytes()));
    return value != boost::none;
  }

  outcome::result<face::PrefixIterPtr> BufferMapStorage::iterPrefix(
      const Key &prefix) const {
    auto bytes{prefix.toBytes()};
    bytes.push_back(kKeySeparator);
    auto cursor{map_->cursor()};
    cursor->seek(bytes);
    OUTCOME_TRY(cursor->status());
    return std::make_unique<PrefixCursor>(std::move(bytes), std::move(cursor));
  }

  outcome::result<boost::optional<face::KeyValue>> BufferMapStorage::iterNext(
      face::PrefixIter &iter) const {
    auto prefix_cursor{dynamic_cast<PrefixCursor *>(&iter)};
    if (!prefix_cursor) {
      return StorageError::kForeignIterator;
    }
    auto &cursor{*prefix_cursor->cursor};
    if (prefix_cursor->started && cursor.isValid()) {
      cursor.next();
    }
    prefix_cursor->started = true;
    if (!prefix_cursor->isValid()) {
      OUTCOME_TRY(cursor.status());
      return boost::none;
    }
    auto key{cursor.key()};
    return face::KeyValue{std::string{common::span::bytestr(key)},
                          cursor.value()};
  }

  outcome::result<void> BufferMapStorage::writeBytes(const Key &key,
                                                     BytesIn value) {
    return map_->put(key.toBytes(), copy(value));
  }

  outcome::result<void> BufferMapStorage::remove(const Key &key) {
    return map_->remove(key.toBytes());
  }
}  // namespace lc::storage
