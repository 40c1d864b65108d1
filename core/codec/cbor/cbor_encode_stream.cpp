/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encode_stream.hpp"

#include <algorithm>

#include "codec/cbor/cbor_errors.hpp"
#include "common/span.hpp"

namespace lc::codec::cbor {
  CborEncodeStream &CborEncodeStream::operator<<(const Bytes &bytes) {
    return *this << BytesIn{bytes};
  }

  CborEncodeStream &CborEncodeStream::operator<<(BytesIn bytes) {
    addCount(1);
    writeBytes(data_, bytes.size());
    append(data_, bytes);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::string_view str) {
    addCount(1);
    writeStr(data_, str.size());
    append(data_, common::span::cbytes(str));
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const std::string &str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(const char *str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(
      const CborEncodeStream &other) {
    addCount(other.is_list_ ? 1 : other.count_);
    if (other.is_list_) {
      writeList(data_, other.count_);
    }
    append(data_, other.data_);
    return *this;
  }

  // RFC 7049 canonical order: shorter keys first, then bytewise
  struct LessCborKey {
    bool operator()(std::string_view lhs, std::string_view rhs) const {
      if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size();
      }
      return lhs < rhs;
    }
  };

  CborEncodeStream &CborEncodeStream::operator<<(
      const std::map<std::string, CborEncodeStream> &map) {
    addCount(1);
    writeMap(data_, map.size());
    std::vector<std::pair<std::string_view, const CborEncodeStream *>> sorted;
    sorted.reserve(map.size());
    for (const auto &pair : map) {
      if (pair.second.count_ != 1) {
        outcome::raise(CborEncodeError::kExpectedMapValueSingle);
      }
      sorted.emplace_back(pair.first, &pair.second);
    }
    std::sort(sorted.begin(), sorted.end(), [](auto &l, auto &r) {
      return LessCborKey{}(l.first, r.first);
    });
    const auto count{count_};
    for (const auto &[key, value] : sorted) {
      *this << key;
      *this << *value;
    }
    count_ = count;
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::nullptr_t) {
    addCount(1);
    writeNull(data_);
    return *this;
  }

  Bytes CborEncodeStream::data() const {
    Bytes result;
    if (is_list_) {
      writeList(result, count_);
    }
    append(result, data_);
    return result;
  }

  size_t CborEncodeStream::count() const {
    return count_;
  }

  CborEncodeStream CborEncodeStream::list() {
    CborEncodeStream stream;
    stream.is_list_ = true;
    return stream;
  }

  std::map<std::string, CborEncodeStream> CborEncodeStream::map() {
    return {};
  }

  void CborEncodeStream::addCount(size_t count) {
    count_ += count;
  }
}  // namespace lc::codec::cbor
