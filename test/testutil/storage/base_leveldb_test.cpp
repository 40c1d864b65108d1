/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_leveldb_test.hpp"

namespace test {

  BaseLevelDB_Test::BaseLevelDB_Test(const fs::path &path)
      : BaseFS_Test(path) {}

  void BaseLevelDB_Test::open() {
    auto r = LevelDB::create(getPathString());
    if (!r) {
      throw std::invalid_argument(r.error().message());
    }

    db_ = std::move(r.value());
    ASSERT_TRUE(db_) << "BaseLevelDB_Test: db is nullptr";
    storage_ = std::make_shared<lc::storage::BufferMapStorage>(db_);
  }

  void BaseLevelDB_Test::reopen() {
    storage_.reset();
    db_.reset();
    open();
  }

  void BaseLevelDB_Test::SetUp() {
    BaseFS_Test::SetUp();
    open();
  }

  void BaseLevelDB_Test::TearDown() {
    storage_.reset();
    db_.reset();
    clear();
  }
}  // namespace test
