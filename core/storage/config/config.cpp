/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/config/config.hpp"

#include <functional>

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace lc::storage::config {
  namespace pt = boost::property_tree;

  Config Config::defaults() {
    Config config;
    config.ptree_.put<std::string>(kStoragePath, "ledger");
    config.ptree_.put<std::string>(kMapRoot, "state/map");
    config.ptree_.put<uint64_t>(kGasLimit, 0);
    config.ptree_.put<std::string>(kLogLevel, "info");
    return config;
  }

  outcome::result<void> Config::load(const std::string &filename) {
    if (!boost::filesystem::exists(filename)) {
      return ConfigError::kCannotOpenFile;
    }
    pt::ptree loaded;
    try {
      pt::read_json(filename, loaded);
    } catch (const pt::json_parser::json_parser_error &) {
      return ConfigError::kJSONParserError;
    }
    std::function<void(const std::string &, const pt::ptree &)> merge{
        [&](const std::string &path, const pt::ptree &node) {
          if (node.empty()) {
            ptree_.put(pt::ptree::path_type{path, '.'}, node.data());
            return;
          }
          for (const auto &[name, child] : node) {
            merge(path.empty() ? name : path + "." + name, child);
          }
        }};
    merge("", loaded);
    return outcome::success();
  }

  outcome::result<void> Config::save(const std::string &filename) const {
    try {
      pt::write_json(filename, ptree_);
    } catch (const pt::file_parser_error &) {
      return ConfigError::kCannotOpenFile;
    }
    return outcome::success();
  }
}  // namespace lc::storage::config
