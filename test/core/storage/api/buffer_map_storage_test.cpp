/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/api/buffer_map_storage.hpp"

#include <gtest/gtest.h>

#include "storage/api/cbor.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/leveldb/leveldb_error.hpp"
#include "storage/storage_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/storage/buffer_map_mock.hpp"
#include "testutil/outcome.hpp"

using lc::Bytes;
using lc::storage::BufferMapCursorMock;
using lc::storage::BufferMapMock;
using lc::storage::BufferMapStorage;
using lc::storage::InMemoryStorage;
using lc::storage::Key;
using lc::storage::LevelDBError;
using lc::storage::StorageError;
using lc::storage::face::KeyValue;
using lc::storage::face::PrefixIter;
using testing::ByMove;
using testing::Return;

struct BufferMapStorageTest : public ::testing::Test {
  /// Drains prefix scan
  std::vector<KeyValue> scan(const Key &prefix) {
    std::vector<KeyValue> entries;
    auto iter{storage.iterPrefix(prefix).value()};
    while (auto entry{storage.iterNext(*iter).value()}) {
      entries.push_back(*entry);
    }
    return entries;
  }

  std::shared_ptr<InMemoryStorage> map = std::make_shared<InMemoryStorage>();
  BufferMapStorage storage{map};
};

/**
 * @given storage over byte map
 * @when write value
 * @then it is stored under bytes of key string form
 */
TEST_F(BufferMapStorageTest, PhysicalKey) {
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("a/b"_key, "1"_bytes));
  EXPECT_OUTCOME_EQ(map->get("a/b"_bytes), "1"_bytes);
  EXPECT_OUTCOME_EQ(storage.readBytes("a/b"_key), "1"_bytes);
  EXPECT_OUTCOME_EQ(storage.hasKey("a/b"_key), true);
  EXPECT_OUTCOME_EQ(storage.hasKey("a"_key), false);
  EXPECT_OUTCOME_EQ(storage.readBytes("a"_key), boost::none);
}

/// Remove of absent key is not an error
TEST_F(BufferMapStorageTest, Remove) {
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("a"_key, "1"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.remove("a"_key));
  EXPECT_OUTCOME_EQ(storage.readBytes("a"_key), boost::none);
  EXPECT_OUTCOME_TRUE_1(storage.remove("a"_key));
}

/**
 * @given keys below prefix, the prefix itself, and keys sharing its string
 * start
 * @when scan prefix
 * @then only descendants are visited
 */
TEST_F(BufferMapStorageTest, PrefixDescendantsOnly) {
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/data"_key, "0"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/data/a"_key, "1"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/data/b/c"_key, "2"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/database"_key, "3"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/dat"_key, "4"_bytes));
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("root/e"_key, "5"_bytes));

  EXPECT_EQ(scan("root/data"_key),
            (std::vector<KeyValue>{{"root/data/a", "1"_bytes},
                                   {"root/data/b/c", "2"_bytes}}));
  EXPECT_TRUE(scan("none"_key).empty());
}

/**
 * @given finished scan
 * @when pull again
 * @then it still ends
 */
TEST_F(BufferMapStorageTest, ScanEndIsSticky) {
  EXPECT_OUTCOME_TRUE_1(storage.writeBytes("p/a"_key, "1"_bytes));
  EXPECT_OUTCOME_TRUE(iter, storage.iterPrefix("p"_key));
  EXPECT_OUTCOME_TRUE(first, storage.iterNext(*iter));
  EXPECT_TRUE(first);
  EXPECT_OUTCOME_EQ(storage.iterNext(*iter), boost::none);
  EXPECT_OUTCOME_EQ(storage.iterNext(*iter), boost::none);
}

/// Iterator of another storage is rejected
TEST_F(BufferMapStorageTest, ForeignIterator) {
  struct Foreign : PrefixIter {};
  Foreign foreign;
  EXPECT_OUTCOME_ERROR(StorageError::kForeignIterator,
                       storage.iterNext(foreign));
}

/// Typed helpers encode values with cbor
TEST_F(BufferMapStorageTest, Cbor) {
  EXPECT_OUTCOME_TRUE_1(lc::storage::setCbor(storage, "n"_key, 1000));
  EXPECT_OUTCOME_EQ(storage.readBytes("n"_key), "1903E8"_unhex);
  EXPECT_OUTCOME_EQ(lc::storage::tryGetCbor<int>(storage, "n"_key), 1000);
  EXPECT_OUTCOME_EQ(lc::storage::tryGetCbor<int>(storage, "m"_key),
                    boost::none);
}

struct BufferMapStorageMockTest : public ::testing::Test {
  std::shared_ptr<BufferMapMock> map = std::make_shared<BufferMapMock>();
  BufferMapStorage storage{map};
};

/**
 * @given byte map failing to read
 * @when read
 * @then error is propagated unchanged
 */
TEST_F(BufferMapStorageMockTest, ReadError) {
  EXPECT_CALL(*map, tryGet("a"_bytes))
      .WillRepeatedly(Return(LevelDBError::kIOError));
  EXPECT_OUTCOME_ERROR(LevelDBError::kIOError, storage.readBytes("a"_key));
  EXPECT_OUTCOME_ERROR(LevelDBError::kIOError, storage.hasKey("a"_key));
}

/**
 * @given byte map failing to write
 * @when write and remove
 * @then errors are propagated unchanged
 */
TEST_F(BufferMapStorageMockTest, WriteError) {
  EXPECT_CALL(*map, doPut("a"_bytes, "1"_bytes))
      .WillOnce(Return(LevelDBError::kIOError));
  EXPECT_CALL(*map, remove("a"_bytes))
      .WillOnce(Return(LevelDBError::kCorruption));
  EXPECT_OUTCOME_ERROR(LevelDBError::kIOError,
                       storage.writeBytes("a"_key, "1"_bytes));
  EXPECT_OUTCOME_ERROR(LevelDBError::kCorruption, storage.remove("a"_key));
}

/**
 * @given cursor which stops with error in the middle of scan
 * @when scan
 * @then entries before are returned, then the error
 */
TEST_F(BufferMapStorageMockTest, CursorError) {
  auto cursor_ptr{std::make_unique<BufferMapCursorMock>()};
  auto &cursor{*cursor_ptr};
  EXPECT_CALL(cursor, seek("p/"_bytes));
  EXPECT_CALL(cursor, status())
      .WillOnce(Return(lc::outcome::success()))
      .WillOnce(Return(LevelDBError::kCorruption));
  EXPECT_CALL(cursor, isValid())
      .WillOnce(Return(true))
      .WillOnce(Return(true))
      .WillRepeatedly(Return(false));
  EXPECT_CALL(cursor, key()).WillRepeatedly(Return("p/a"_bytes));
  EXPECT_CALL(cursor, value()).WillOnce(Return("1"_bytes));
  EXPECT_CALL(cursor, next());
  EXPECT_CALL(*map, cursor())
      .WillOnce(Return(ByMove(
          std::unique_ptr<lc::storage::BufferMapCursor>{std::move(cursor_ptr)})));

  EXPECT_OUTCOME_TRUE(iter, storage.iterPrefix("p"_key));
  EXPECT_OUTCOME_EQ(storage.iterNext(*iter), (KeyValue{"p/a", "1"_bytes}));
  EXPECT_OUTCOME_ERROR(LevelDBError::kCorruption, storage.iterNext(*iter));
}
