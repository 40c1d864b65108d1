/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string_view>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_token.hpp"

namespace lc::codec::cbor {
  /** Encodes CBOR */
  class CborEncodeStream {
   public:
    static constexpr auto is_cbor_encoder_stream = true;

    /** Encodes integer or bool */
    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
    CborEncodeStream &operator<<(T num) {
      if constexpr (std::is_enum_v<T>) {
        return *this << static_cast<std::underlying_type_t<T>>(num);
      } else {
        addCount(1);
        if constexpr (std::is_same_v<T, bool>) {
          writeBool(data_, num);
        } else if constexpr (std::is_unsigned_v<T>) {
          writeUint(data_, num);
        } else {
          writeInt(data_, num);
        }
      }
      return *this;
    }

    /// Encodes nullable optional value
    template <typename T>
    CborEncodeStream &operator<<(const boost::optional<T> &optional) {
      if (optional) {
        *this << *optional;
      } else {
        *this << nullptr;
      }
      return *this;
    }

    /// Encodes elements into list
    template <typename T>
    CborEncodeStream &operator<<(const std::vector<T> &values) {
      writeList(data_, values.size());
      ++count_;
      const auto count{count_};
      for (auto &value : values) {
        *this << value;
      }
      count_ = count;
      return *this;
    }

    /// Encodes elements into map
    template <typename T>
    CborEncodeStream &operator<<(const std::map<std::string, T> &items) {
      auto m = map();
      for (auto &item : items) {
        m[item.first] << item.second;
      }
      return *this << m;
    }

    /** Encodes bytes */
    CborEncodeStream &operator<<(const Bytes &bytes);
    /** Encodes bytes */
    CborEncodeStream &operator<<(BytesIn bytes);
    /** Encodes string */
    CborEncodeStream &operator<<(std::string_view str);
    CborEncodeStream &operator<<(const std::string &str);
    CborEncodeStream &operator<<(const char *str);
    /** Encodes list container encode substream */
    CborEncodeStream &operator<<(const CborEncodeStream &other);
    /** Encodes map container encode substream map with canonical order */
    CborEncodeStream &operator<<(
        const std::map<std::string, CborEncodeStream> &map);
    /** Encodes null */
    CborEncodeStream &operator<<(std::nullptr_t);
    /** Returns CBOR bytes of encoded elements */
    Bytes data() const;
    /** Returns the number of elements */
    size_t count() const;
    /** Creates list container encode substream */
    static CborEncodeStream list();
    /** Creates map container encode substream map */
    static std::map<std::string, CborEncodeStream> map();

   private:
    void addCount(size_t count);

    bool is_list_{false};
    Bytes data_{};
    size_t count_{0};
  };
}  // namespace lc::codec::cbor
