/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * This file contains:
 *  - BufferMap - contains key-value bindings of byte buffers
 *  - PersistentBufferMap - stores key-value bindings on filesystem or remote
 * connection.
 */

#include "common/bytes.hpp"
#include "storage/face/generic_map.hpp"
#include "storage/face/persistent_map.hpp"

namespace lc::storage {

  using BufferMap = face::GenericMap<Bytes, Bytes>;

  using PersistentBufferMap = face::PersistentMap<Bytes, Bytes>;

  using BufferMapCursor = face::MapCursor<Bytes, Bytes>;

  using MapPtr = std::shared_ptr<PersistentBufferMap>;

}  // namespace lc::storage
