/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "common/outcome.hpp"
#include "storage/buffer_map.hpp"

namespace lc::storage {
  /**
   * Simple storage that conforms PersistentMap interface
   * Mostly needed to have an in-memory ledger state in tests and tools to
   * avoid integration with LevelDB
   */
  class InMemoryStorage : public PersistentBufferMap,
                          public std::enable_shared_from_this<InMemoryStorage> {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<Bytes> get(const Bytes &key) const override;

    outcome::result<boost::optional<Bytes>> tryGet(
        const Bytes &key) const override;

    outcome::result<void> put(const Bytes &key, const Bytes &value) override;

    outcome::result<void> put(const Bytes &key, Bytes &&value) override;

    bool contains(const Bytes &key) const override;

    outcome::result<void> remove(const Bytes &key) override;

    std::unique_ptr<BufferMapCursor> cursor() override;

    size_t size() const;

   private:
    friend class InMemoryCursor;
    std::map<Bytes, Bytes> storage;
  };

}  // namespace lc::storage
