/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/state/state.hpp"
#include "codec/cbor/cbor_errors.hpp"

namespace lc::cli::_state {
  inline void printValue(const boost::optional<std::string> &value) {
    if (value) {
      fmt::print("{}\n", *value);
    } else {
      fmt::print("<none>\n");
    }
  }

  struct State_map_get : Empty {
    CLI_RUN() {
      State::Env env{argm};
      const auto &key{cliArgv(argv, 0, "key")};
      printValue(cliTry(env.map.get(*env.storage, key), "get {}", key));
    }
  };

  struct State_map_insert : Empty {
    CLI_RUN() {
      State::Env env{argm};
      const auto &key{cliArgv(argv, 0, "key")};
      const auto &value{cliArgv(argv, 1, "value")};
      const auto previous{
          cliTry(env.map.insert(*env.storage, key, value), "insert {}", key)};
      env.log->info("inserted {}", env.map.dataKey(key));
      printValue(previous);
    }
  };

  struct State_map_remove : Empty {
    CLI_RUN() {
      State::Env env{argm};
      const auto &key{cliArgv(argv, 0, "key")};
      const auto previous{
          cliTry(env.map.remove(*env.storage, key), "remove {}", key)};
      env.log->info("removed {}", env.map.dataKey(key));
      printValue(previous);
    }
  };

  /**
   * Prints every decodable value.
   * Undecodable entries are reported and skipped, storage errors stop the
   * listing.
   */
  struct State_map_list : Empty {
    CLI_RUN() {
      State::Env env{argm};
      auto iter{cliTry(env.map.iter(*env.storage), "iterating {}",
                       env.map.dataPrefix())};
      size_t count{}, skipped{};
      for (const auto &item : iter) {
        if (item) {
          fmt::print("{}\n", item.value());
          ++count;
          continue;
        }
        if (item.error().category()
            != make_error_code(codec::cbor::CborDecodeError::kInvalidCbor)
                   .category()) {
          throw CliError{"iterating {} (error_code: {:#})",
                         env.map.dataPrefix(),
                         item.error()};
        }
        env.log->warn("skipped entry: {:#}", item.error());
        ++skipped;
      }
      env.log->info("listed {} values, skipped {}", count, skipped);
    }
  };
}  // namespace lc::cli::_state
