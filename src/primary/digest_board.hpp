/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <optional>
#include <unordered_set>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/batch.hpp"
#include "utils/safe_object.hpp"

namespace weave::primary {

  /**
   * Batches reported by local workers and not yet proposed, in arrival
   * order. Bounded: when full, the oldest batch is evicted, since workers
   * keep the batch itself.
   */
  class DigestBoard {
   public:
    DigestBoard(qtils::SharedRef<log::LoggingSystem> logsys, size_t capacity);

    /**
     * Appends a batch unless it is already on the board.
     * @return false for a duplicate
     */
    bool add(const BatchInfo &batch);

    /// Removes and returns the oldest batches within both limits
    std::vector<BatchInfo> take(size_t max_count, uint64_t max_bytes);

    /// Puts batches of a discarded header back in front, oldest first
    void restore(const std::vector<BatchInfo> &batches);

    [[nodiscard]] size_t size() const;

    [[nodiscard]] uint64_t bytes() const;

    [[nodiscard]] size_t evicted() const;

   private:
    struct Board {
      std::deque<BatchInfo> queue;
      std::unordered_set<Digest> index;
      uint64_t bytes = 0;
      size_t evicted = 0;
    };

    /// Drops from the front until there is room for one more
    std::optional<BatchInfo> evictOldest(Board &board) const;

    log::Logger logger_;
    const size_t capacity_;
    utils::SafeObject<Board> board_;
  };

}  // namespace weave::primary
