/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/digest_board.hpp"

namespace weave::primary {

  DigestBoard::DigestBoard(qtils::SharedRef<log::LoggingSystem> logsys,
                           size_t capacity)
      : logger_(logsys->getLogger("DigestBoard", "proposer")),
        capacity_(capacity == 0 ? 1 : capacity) {}

  bool DigestBoard::add(const BatchInfo &batch) {
    auto evicted = board_.exclusiveAccess(
        [&](Board &board) -> std::optional<std::optional<BatchInfo>> {
          if (board.index.contains(batch.digest)) {
            return std::nullopt;
          }
          auto evicted = evictOldest(board);
          board.queue.push_back(batch);
          board.index.insert(batch.digest);
          board.bytes += batch.size;
          return evicted;
        });
    if (not evicted.has_value()) {
      SL_TRACE(logger_, "Batch {:0x} is already on the board", batch.digest);
      return false;
    }
    if (evicted->has_value()) {
      SL_DEBUG(logger_,
               "Board is full, evicted batch {:0x} of worker {}",
               evicted->value().digest,
               evicted->value().worker_id);
    }
    return true;
  }

  std::vector<BatchInfo> DigestBoard::take(size_t max_count,
                                           uint64_t max_bytes) {
    return board_.exclusiveAccess([&](Board &board) {
      std::vector<BatchInfo> taken;
      uint64_t bytes = 0;
      while (not board.queue.empty() and taken.size() < max_count) {
        auto &front = board.queue.front();
        // one oversized batch still goes alone, otherwise it stays forever
        if (not taken.empty() and bytes + front.size > max_bytes) {
          break;
        }
        bytes += front.size;
        board.index.erase(front.digest);
        board.bytes -= front.size;
        taken.emplace_back(front);
        board.queue.pop_front();
      }
      return taken;
    });
  }

  void DigestBoard::restore(const std::vector<BatchInfo> &batches) {
    auto dropped = board_.exclusiveAccess([&](Board &board) {
      size_t dropped = 0;
      for (auto it = batches.rbegin(); it != batches.rend(); ++it) {
        if (board.index.contains(it->digest)) {
          continue;
        }
        if (board.queue.size() >= capacity_) {
          ++dropped;
          continue;
        }
        board.queue.push_front(*it);
        board.index.insert(it->digest);
        board.bytes += it->size;
      }
      board.evicted += dropped;
      return dropped;
    });
    SL_DEBUG(logger_,
             "Restored {} batches to the board",
             batches.size() - dropped);
    if (dropped != 0) {
      SL_WARN(logger_, "Board is full, {} restored batches dropped", dropped);
    }
  }

  size_t DigestBoard::size() const {
    return board_.sharedAccess([](const Board &board) {
      return board.queue.size();
    });
  }

  uint64_t DigestBoard::bytes() const {
    return board_.sharedAccess([](const Board &board) { return board.bytes; });
  }

  size_t DigestBoard::evicted() const {
    return board_.sharedAccess(
        [](const Board &board) { return board.evicted; });
  }

  std::optional<BatchInfo> DigestBoard::evictOldest(Board &board) const {
    if (board.queue.size() < capacity_) {
      return std::nullopt;
    }
    auto oldest = board.queue.front();
    board.queue.pop_front();
    board.index.erase(oldest.digest);
    board.bytes -= oldest.size;
    ++board.evicted;
    return oldest;
  }

}  // namespace weave::primary
