/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/state/state.hpp"

namespace lc::cli::_state {
  struct State_config_init : Empty {
    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "file")};
      cliTry(Config::defaults().save(path), "saving {}", path);
      fmt::print("{}\n", path);
    }
  };
}  // namespace lc::cli::_state
