/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <fmt/format.h>

#include "cli/cli.hpp"
#include "collections/lazy_map.hpp"
#include "common/logger.hpp"
#include "storage/api/buffer_map_storage.hpp"
#include "storage/config/config.hpp"
#include "storage/gas/metered_storage.hpp"
#include "storage/leveldb/leveldb.hpp"

namespace lc::cli::_state {
  using collections::LazyMap;
  using storage::Key;
  using storage::config::Config;
  using storage::gas::GasAmount;
  using storage::gas::GasMeter;

  /// Map of strings inspected by the tool
  using StringMap = LazyMap<std::string, std::string>;

  struct State {
    struct Args {
      CLI_OPTIONAL("repo", "ledger LevelDB directory", boost::filesystem::path)
      repo;
      CLI_OPTIONAL("config", "JSON config file", std::string) config;
      CLI_OPTIONAL("root", "map root key (default: state/map)", std::string)
      root;
      CLI_OPTIONAL("gas-limit", "gas limit, 0 is unmetered", GasAmount)
      gas_limit;

      CLI_OPTS() {
        Opts opts;
        repo(opts);
        config(opts);
        root(opts);
        gas_limit(opts);
        return opts;
      }
    };
    CLI_NO_RUN();

    /**
     * Storage and map selected by global options.
     * Options given on command line override the config file.
     */
    struct Env {
      common::Logger log{common::createLogger("lc_state")};
      Config config{Config::defaults()};
      std::shared_ptr<storage::face::Storage> storage;
      std::shared_ptr<GasMeter> meter;
      StringMap map{Key{}};

      explicit Env(const ArgsMap &argm) {
        const auto &args{argm.of<State>()};
        if (args.config) {
          cliTry(config.load(*args.config), "loading config {}", *args.config);
        }
        if (args.repo) {
          cliTry(config.set(storage::config::kStoragePath, args.repo->string()));
        }
        if (args.root) {
          cliTry(config.set(storage::config::kMapRoot, *args.root));
        }
        if (args.gas_limit) {
          cliTry(config.set(storage::config::kGasLimit, *args.gas_limit));
        }

        const auto level{
            cliTry(config.get<std::string>(storage::config::kLogLevel))};
        if (!common::setLogLevel(level)) {
          throw CliError{"unknown log level {}", level};
        }

        const auto path{
            cliTry(config.get<std::string>(storage::config::kStoragePath))};
        const auto root{
            cliTry(config.get<std::string>(storage::config::kMapRoot))};
        const auto limit{
            cliTry(config.get<GasAmount>(storage::config::kGasLimit))};
        log->debug("storage {}, map root {}, gas limit {}", path, root, limit);

        const auto leveldb{
            cliTry(storage::LevelDB::create(path), "opening {}", path)};
        storage = std::make_shared<storage::BufferMapStorage>(leveldb);
        if (limit != 0) {
          meter = std::make_shared<GasMeter>(limit);
          storage =
              std::make_shared<storage::gas::MeteredStorage>(storage, meter);
        }
        map = StringMap{cliTry(Key::parse(root), "parsing root {}", root)};
      }

      ~Env() {
        if (meter) {
          log->info("gas used {} of {}", meter->used(), meter->limit());
        }
      }
    };
  };
}  // namespace lc::cli::_state
