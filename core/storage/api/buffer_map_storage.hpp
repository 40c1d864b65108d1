/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/buffer_map.hpp"
#include "storage/face/storage.hpp"

namespace lc::storage {

  /**
   * @brief Ledger storage over byte-keyed map.
   * Physical key of Key is the bytes of its string form.
   */
  class BufferMapStorage : public face::Storage {
   public:
    struct PrefixCursor : face::PrefixIter {
      PrefixCursor(Bytes prefix, std::unique_ptr<BufferMapCursor> cursor);

      bool isValid() const;

      Bytes prefix;
      std::unique_ptr<BufferMapCursor> cursor;
      bool started{false};
    };

    explicit BufferMapStorage(MapPtr map);

    outcome::result<boost::optional<Bytes>> readBytes(
        const Key &key) const override;

    outcome::result<bool> hasKey(const Key &key) const override;

    outcome::result<face::PrefixIterPtr> iterPrefix(
        const Key &prefix) const override;

    outcome::result<boost::optional<face::KeyValue>> iterNext(
        face::PrefixIter &iter) const override;

    outcome::result<void> writeBytes(const Key &key, BytesIn value) override;

    outcome::result<void> remove(const Key &key) override;

   private:
    MapPtr map_;
  };

}  // namespace lc::storage
