/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/property_tree/ptree.hpp>
#include <string>

#include "common/outcome.hpp"
#include "storage/config/config_error.hpp"

namespace lc::storage::config {

  /** @brief Configuration key, dot separated path in the document */
  using ConfigKey = std::string;

  /// LevelDB directory of the ledger state
  const ConfigKey kStoragePath{"storage.path"};
  /// Root key of the inspected map
  const ConfigKey kMapRoot{"map.root"};
  /// Gas limit applied to each command, zero means unmetered
  const ConfigKey kGasLimit{"gas.limit"};
  /// spdlog level name
  const ConfigKey kLogLevel{"log.level"};

  /**
   * @brief Ledger state tool configuration
   */
  class Config {
   public:
    virtual ~Config() = default;

    /**
     * @brief Configuration with default value for every known key
     */
    static Config defaults();

    /**
     * @brief Save config to file
     * @param filename - path to a file to store config
     * @return nothing or error occurred
     */
    outcome::result<void> save(const std::string &filename) const;

    /**
     * @brief Load config from file, loaded values override present ones
     * @param filename - path to a file with config
     * @return nothing or error occurred
     */
    outcome::result<void> load(const std::string &filename);

    /**
     * Set config value
     * @tparam T - parameter of a configuration value
     * @param key - configuration key
     * @param value - configuration value
     * @return - nothing or error occurred
     */
    template <typename T>
    outcome::result<void> set(const ConfigKey &key, const T &value) {
      ptree_.put<T>(key, value);
      return outcome::success();
    }

    /**
     * Get config value by key
     * @tparam T - expected parameter of a configuration value
     * @param key - configuration key
     * @return value or error occurred
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key) const {
      try {
        return ptree_.get<T>(key);
      } catch (const boost::property_tree::ptree_bad_path &) {
        return ConfigError::kBadPath;
      } catch (const boost::property_tree::ptree_bad_data &) {
        return ConfigError::kBadValue;
      }
    }

   private:
    boost::property_tree::ptree ptree_;
  };

}  // namespace lc::storage::config
