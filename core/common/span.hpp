/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>
#include <gsl/span>
#include <string_view>

namespace lc {
  using BytesIn = gsl::span<const uint8_t>;

  inline bool startsWith(BytesIn l, BytesIn r) {
    return l.size() >= r.size()
           && (r.empty() || memcmp(l.data(), r.data(), r.size()) == 0);
  }
}  // namespace lc

namespace lc::common::span {
  template <typename To, typename From>
  constexpr auto cast(From *ptr) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<To *>(ptr);
  }

  template <typename To, typename From>
  constexpr auto cast(gsl::span<From> span) {
    static_assert(sizeof(To) == 1);
    return gsl::make_span(cast<To>(span.data()), span.size_bytes());
  }

  inline auto cbytes(std::string_view str) {
    return gsl::make_span(cast<const uint8_t>(str.data()), str.size());
  }

  constexpr auto cstring(BytesIn span) {
    return cast<const char>(span);
  }

  constexpr auto bytestr(BytesIn span) {
    return std::string_view(cstring(span).data(), span.size());
  }
}  // namespace lc::common::span
