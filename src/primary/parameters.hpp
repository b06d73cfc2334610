/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "types/types.hpp"

namespace weave::primary {

  using std::chrono_literals::operator""ms;
  using std::chrono_literals::operator""s;

  /// Tunables of the synchronizer. None of them affects safety.
  struct SyncParameters {
    /// Delay before the second attempt, doubled for every next one
    std::chrono::milliseconds retry_base_delay = 200ms;
    std::chrono::milliseconds retry_max_delay = 5s;
    /// Attempts after which a digest is reported unavailable
    uint32_t max_attempts = 8;
    /// Total time budget of one fetch
    std::chrono::milliseconds deadline = 30s;
    /// Response wait time of a single request
    std::chrono::milliseconds request_timeout = 2s;
    /// Peers asked per attempt
    size_t retry_nodes = 3;
    /// Digests served or requested per message
    size_t max_fetch_batch = 256;
  };

  struct Parameters {
    /// Rounds kept behind the current one before eviction
    Round gc_depth = 50;
    /// Headers further ahead of the current round wait for synchronization
    Round max_round_lookahead = 10;

    size_t header_num_of_batches_threshold = 32;
    size_t max_header_num_of_batches = 1000;
    uint64_t max_header_payload_size = 512 * 1024;
    std::chrono::milliseconds min_header_delay = 100ms;
    std::chrono::milliseconds max_header_delay = 1s;

    /// Life time of a vertex suspended on missing parents
    std::chrono::milliseconds pending_timeout = 60s;
    size_t max_pending_vertices = 10'000;

    size_t digest_board_capacity = 100'000;
    size_t channel_capacity = 1'000;
    size_t consensus_feed_capacity = 10'000;
    std::chrono::milliseconds tick_interval = 50ms;
    std::chrono::milliseconds stall_alert_threshold = 30s;

    SyncParameters sync;
  };

}  // namespace weave::primary
