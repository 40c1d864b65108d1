/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/state/config.hpp"
#include "cli/state/map.hpp"
#include "cli/tree.hpp"

namespace lc::cli::_state {
  const auto _tree{tree<State>({
      {"map",
       tree<Group>({
           {"get", tree<State_map_get>()},
           {"insert", tree<State_map_insert>()},
           {"remove", tree<State_map_remove>()},
           {"list", tree<State_map_list>()},
       })},
      {"config",
       tree<Group>({
           {"init", tree<State_config_init>()},
       })},
  })};
}  // namespace lc::cli::_state
