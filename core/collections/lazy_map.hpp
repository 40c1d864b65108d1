/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iterator>

#include <spdlog/fmt/fmt.h>

#include "storage/api/cbor.hpp"

namespace lc::collections {
  using storage::Key;

  /// Subkey below map root which holds elements
  constexpr auto kDataSubkey{"data"};

  /// Renders key with its fmt representation
  template <typename K>
  struct DisplayKeyer {
    inline static std::string encode(const K &key) {
      return fmt::to_string(key);
    }
  };

  /**
   * @brief Map view over ledger storage.
   * Elements are stored one per storage key, nothing is loaded until it is
   * accessed, and the map holds no state but its root key. Keys which render
   * to the same string address the same element.
   * @tparam K - key type, rendered to storage key segment with Keyer
   * @tparam V - cbor encodable value type
   */
  template <typename K, typename V, typename Keyer = DisplayKeyer<K>>
  struct LazyMap {
    /**
     * @brief Single pass producer of decoded values under data prefix.
     * Owns backend cursor, borrows storage.
     */
    struct Iter {
      using Item = outcome::result<V>;

      /// Input iterator over remaining items
      struct iterator {
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using pointer = const Item *;
        using reference = const Item &;

        reference operator*() const {
          return *item;
        }
        pointer operator->() const {
          return &*item;
        }
        iterator &operator++() {
          item = iter->next();
          return *this;
        }
        bool operator==(const iterator &other) const {
          return !item && !other.item;
        }
        bool operator!=(const iterator &other) const {
          return !(*this == other);
        }

        Iter *iter{nullptr};
        boost::optional<Item> item;
      };

      /**
       * @brief Pull next item
       * @return decoded value or error of this entry, none at end of data
       */
      boost::optional<Item> next() {
        if (done) {
          return boost::none;
        }
        auto entry{reader->iterNext(*cursor)};
        if (!entry) {
          return Item{outcome::failure(entry.error())};
        }
        if (!entry.value()) {
          done = true;
          return boost::none;
        }
        return codec::cbor::decode<V>(entry.value()->second);
      }

      iterator begin() {
        return {this, next()};
      }

      iterator end() {
        return {this, boost::none};
      }

      const storage::face::StorageRead *reader;
      storage::face::PrefixIterPtr cursor;
      bool done{false};
    };

    explicit LazyMap(Key root) : root{std::move(root)} {}

    /// Parent key of all elements
    Key dataPrefix() const {
      return root.push(kDataSubkey);
    }

    /// Storage key of element
    Key dataKey(const K &key) const {
      return dataPrefix().push(Keyer::encode(key));
    }

    /**
     * @brief Read element
     * @return value, none if absent, or backend or decode error
     */
    outcome::result<boost::optional<V>> get(
        const storage::face::StorageRead &storage, const K &key) const {
      return storage::tryGetCbor<V>(storage, dataKey(key));
    }

    /**
     * @brief Write element, overwriting present one
     * @return previous value, none if there was no value
     */
    outcome::result<boost::optional<V>> insert(storage::face::Storage &storage,
                                               const K &key,
                                               const V &value) const {
      OUTCOME_TRY(previous, get(storage, key));
      OUTCOME_TRY(storage::setCbor(storage, dataKey(key), value));
      return std::move(previous);
    }

    /**
     * @brief Delete element, absent element is not an error
     * @return removed value, none if there was no value
     */
    outcome::result<boost::optional<V>> remove(storage::face::Storage &storage,
                                               const K &key) const {
      OUTCOME_TRY(previous, get(storage, key));
      OUTCOME_TRY(storage.remove(dataKey(key)));
      return std::move(previous);
    }

    /**
     * @brief Open scan over elements, order depends on storage.
     * Cost of full scan is proportional to map size.
     * @return lazy iterator, or error if storage can't open the scan
     */
    outcome::result<Iter> iter(
        const storage::face::StorageRead &storage) const {
      OUTCOME_TRY(cursor, storage.iterPrefix(dataPrefix()));
      return Iter{&storage, std::move(cursor)};
    }

    Key root;
  };
}  // namespace lc::collections
