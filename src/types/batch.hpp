/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/types.hpp"

namespace weave {

  /// Batch reference carried in a header payload
  struct BatchRef : ssz::ssz_container {
    Digest digest;
    WorkerId worker_id = 0;

    SSZ_CONT(digest, worker_id);
    bool operator==(const BatchRef &) const = default;
  };

  /// What a worker reports about a sealed batch
  struct BatchInfo : ssz::ssz_container {
    Digest digest;
    WorkerId worker_id = 0;
    /// Serialized batch size in bytes
    uint64_t size = 0;

    SSZ_CONT(digest, worker_id, size);
    bool operator==(const BatchInfo &) const = default;

    BatchRef ref() const {
      return BatchRef{.digest = digest, .worker_id = worker_id};
    }
  };

}  // namespace weave
