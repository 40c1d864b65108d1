/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/run.hpp"
#include "cli/state/_tree.hpp"

int main(int argc, const char *argv[]) {
  return lc::cli::run("lc_state", lc::cli::_state::_tree, argc, argv);
}
