/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/spaces.hpp"

namespace weave::storage {

  /// Storage split into independent spaces with atomic cross-space batches
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve a pointer to the map representing particular storage space
     * @param space - identifier of required space
     * @return a pointer buffer storage for a space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;

    /**
     * Creates a batch whose writes, in any spaces, land all together on
     * commit or not at all.
     */
    virtual std::unique_ptr<BufferSpacedBatch> createBatch() = 0;
  };

}  // namespace weave::storage
