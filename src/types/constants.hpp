/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

namespace weave {
  /// Upper bound of committee size, bounds signer and parent lists
  constexpr size_t kMaxCommitteeSize = 1024;

  /// Upper bound of batch references a single header may carry
  constexpr size_t kMaxHeaderBatches = 1 << 16;

  /// Upper bound of digests in one fetch request or response
  constexpr size_t kMaxFetchDigests = 1024;
}  // namespace weave
