/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decode_stream.hpp"

#include "common/span.hpp"

namespace lc::codec::cbor {
  CborDecodeStream::CborDecodeStream(BytesIn data) : partial{data} {
    readToken();
  }

  CborDecodeStream &CborDecodeStream::operator>>(Bytes &bytes) {
    BytesIn _bytes;
    if (!codec::read(_bytes, partial, bytesLength())) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    copy(bytes, _bytes);
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(std::string &str) {
    BytesIn bytes;
    if (!codec::read(bytes, partial, _as(token.strSize()))) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    str = common::span::bytestr(bytes);
    readToken();
    return *this;
  }

  CborDecodeStream CborDecodeStream::list() {
    listLength();
    CborDecodeStream stream{readNested()};
    stream.readToken();
    return stream;
  }

  std::map<std::string, CborDecodeStream> CborDecodeStream::map() {
    const auto n{_as(token.mapCount())};
    readToken();
    std::map<std::string, CborDecodeStream> map;
    std::string key;
    for (size_t i{}; i < n; ++i) {
      *this >> key;
      map.emplace(key, CborDecodeStream{readNested()});
    }
    return map;
  }

  CborDecodeStream &CborDecodeStream::named(
      std::map<std::string, CborDecodeStream> &map, const std::string &name) {
    auto it{map.find(name)};
    if (it == map.end()) {
      outcome::raise(CborDecodeError::kKeyNotFound);
    }
    return it->second;
  }
}  // namespace lc::codec::cbor
