/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec_or_view.hpp>

#include "storage/face/generic_maps.hpp"
#include "storage/face/write_batch.hpp"
#include "storage/spaces.hpp"

namespace weave::storage::face {

  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVecOrView;
  };

  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace weave::storage::face

namespace weave::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  using BufferBatch = face::WriteBatch<ByteVec, ByteVec>;

  using BufferSpacedBatch = face::SpacedBatch<Space, ByteVec, ByteVec>;

  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;

  using BufferStorageCursor = face::MapCursor<ByteVec, ByteVec>;

}  // namespace weave::storage
