/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/key/key.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

#include "common/span.hpp"

namespace lc::storage {
  Key::Key(std::vector<std::string> segments)
      : segments_{std::move(segments)} {}

  outcome::result<Key> Key::parse(std::string_view str) {
    if (str.empty()) {
      return KeyError::kEmptyKey;
    }
    std::vector<std::string> segments;
    boost::algorithm::split(segments, std::string{str}, [](char c) {
      return c == kKeySeparator;
    });
    for (const auto &segment : segments) {
      if (segment.empty()) {
        return KeyError::kEmptySegment;
      }
    }
    return Key{std::move(segments)};
  }

  Key Key::fromSegment(std::string segment) {
    return Key{std::vector<std::string>{std::move(segment)}};
  }

  Key Key::push(std::string segment) const {
    auto segments{segments_};
    segments.push_back(std::move(segment));
    return Key{std::move(segments)};
  }

  Key Key::join(const Key &other) const {
    auto segments{segments_};
    segments.insert(
        segments.end(), other.segments_.begin(), other.segments_.end());
    return Key{std::move(segments)};
  }

  const std::vector<std::string> &Key::segments() const {
    return segments_;
  }

  size_t Key::size() const {
    return segments_.size();
  }

  bool Key::empty() const {
    return segments_.empty();
  }

  const std::string &Key::lastSegment() const {
    static const std::string kEmpty;
    return segments_.empty() ? kEmpty : segments_.back();
  }

  bool Key::isPrefixOf(const Key &other) const {
    return segments_.size() <= other.segments_.size()
           && std::equal(
               segments_.begin(), segments_.end(), other.segments_.begin());
  }

  std::string Key::toString() const {
    return boost::algorithm::join(segments_, std::string{kKeySeparator});
  }

  Bytes Key::toBytes() const {
    return copy(common::span::cbytes(toString()));
  }

  bool Key::operator==(const Key &other) const {
    return segments_ == other.segments_;
  }

  bool Key::operator<(const Key &other) const {
    return segments_ < other.segments_;
  }
}  // namespace lc::storage

OUTCOME_CPP_DEFINE_CATEGORY(lc::storage, KeyError, e) {
  using lc::storage::KeyError;
  switch (e) {
    case KeyError::kEmptyKey:
      return "KeyError: key is empty";
    case KeyError::kEmptySegment:
      return "KeyError: key has an empty segment";
    default:
      return "KeyError: unknown error";
  }
}
