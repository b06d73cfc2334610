/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace weave::storage {

  /**
   * Logical storage spaces. The RocksDB backend keeps one column family per
   * space, the in-memory backend one map per space.
   */
  enum class Space : uint8_t {
    Default = 0,  ///< node markers: rounds, acknowledgements

    Headers,            ///< header digest -> header
    HeaderRounds,       ///< round || header digest -> empty
    Certificates,       ///< certificate digest -> certificate
    CertificateRounds,  ///< round || author -> certificate digest
    LastVoted,          ///< author -> last voted (round, header digest)
    PendingBatches,     ///< batch digest -> batch info not yet proposed
    OwnHeaders,         ///< round -> header this node proposed, with its batches

    Total  ///< Total number of defined spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);
}  // namespace weave::storage
