/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cassert>

#include "storage/in_memory/in_memory_storage.hpp"

namespace lc::storage {

  /**
   * @brief Instance of cursor can be used as bidirectional iterator over
   * key-value bindings of the Map.
   * Erasing the current entry from the storage invalidates the cursor.
   */
  class InMemoryCursor : public BufferMapCursor {
   public:
    explicit InMemoryCursor(std::shared_ptr<InMemoryStorage> storage)
        : storage_(std::move(storage)),
          current_iterator_{storage_->storage.end()} {}

    void seekToFirst() override {
      current_iterator_ = storage_->storage.begin();
    }

    void seek(const Bytes &key) override {
      current_iterator_ = storage_->storage.lower_bound(key);
    }

    void seekToLast() override {
      current_iterator_ = storage_->storage.end();
      if (current_iterator_ != storage_->storage.begin()) {
        --current_iterator_;
      }
    }

    bool isValid() const override {
      return current_iterator_ != storage_->storage.end();
    }

    void next() override {
      assert(isValid());
      ++current_iterator_;
    }

    void prev() override {
      assert(isValid());
      if (current_iterator_ == storage_->storage.begin()) {
        current_iterator_ = storage_->storage.end();
      } else {
        --current_iterator_;
      }
    }

    Bytes key() const override {
      return current_iterator_->first;
    }

    Bytes value() const override {
      return current_iterator_->second;
    }

    outcome::result<void> status() const override {
      return outcome::success();
    }

   private:
    std::shared_ptr<InMemoryStorage> storage_;
    std::map<Bytes, Bytes>::iterator current_iterator_;
  };

}  // namespace lc::storage
