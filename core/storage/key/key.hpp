/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace lc::storage {
  enum class KeyError {
    kEmptyKey = 1,
    kEmptySegment,
  };

  /// Separator of key segments in the string form of a key
  constexpr char kKeySeparator{'/'};

  /**
   * @brief Structured storage path.
   * Physical storage key is the string form, segments joined with
   * kKeySeparator.
   */
  class Key {
   public:
    Key() = default;

    /**
     * @brief Parse string form of a key
     * @param str - segments separated with kKeySeparator
     * @return parsed key, or KeyError if any segment is empty
     */
    static outcome::result<Key> parse(std::string_view str);

    static Key fromSegment(std::string segment);

    /// Returns new key with segment appended
    Key push(std::string segment) const;

    /// Returns new key with all segments of other appended
    Key join(const Key &other) const;

    const std::vector<std::string> &segments() const;

    size_t size() const;

    bool empty() const;

    const std::string &lastSegment() const;

    /// True if this key equals other or is one of its ancestors
    bool isPrefixOf(const Key &other) const;

    std::string toString() const;

    Bytes toBytes() const;

    bool operator==(const Key &other) const;

    bool operator<(const Key &other) const;

   private:
    explicit Key(std::vector<std::string> segments);

    std::vector<std::string> segments_;
  };

  LC_OPERATOR_NOT_EQUAL(Key)

  inline std::ostream &operator<<(std::ostream &os, const Key &key) {
    return os << key.toString();
  }
}  // namespace lc::storage

template <>
struct fmt::formatter<lc::storage::Key> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const lc::storage::Key &key, FormatContext &ctx) const {
    return fmt::formatter<std::string>::format(key.toString(), ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(lc::storage, KeyError);
