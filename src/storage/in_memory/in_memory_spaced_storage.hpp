/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <vector>

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace weave::storage {

  /**
   * SpacedStorage kept in memory, one InMemoryStorage per space. Batches
   * are applied under a commit lock, so two batches never interleave.
   */
  class InMemorySpacedStorage : public SpacedStorage {
   public:
    InMemorySpacedStorage() {
      for (auto &space : spaces_) {
        space = std::make_shared<InMemoryStorage>();
      }
    }

    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      return spaces_.at(static_cast<size_t>(space));
    }

    std::unique_ptr<BufferSpacedBatch> createBatch() override {
      return std::make_unique<Batch>(*this);
    }

   private:
    class Batch : public BufferSpacedBatch {
     public:
      explicit Batch(InMemorySpacedStorage &storage) : storage_{storage} {}

      outcome::result<void> put(Space space,
                                const ByteView &key,
                                ByteVecOrView &&value) override {
        return batchFor(space).put(key, std::move(value));
      }

      outcome::result<void> remove(Space space, const ByteView &key) override {
        return batchFor(space).remove(key);
      }

      outcome::result<void> commit() override {
        std::lock_guard lock(storage_.commit_mutex_);
        for (auto &batch : batches_) {
          if (batch) {
            OUTCOME_TRY(batch->commit());
          }
        }
        return outcome::success();
      }

      void clear() override {
        for (auto &batch : batches_) {
          batch.reset();
        }
      }

     private:
      InMemoryBatch &batchFor(Space space) {
        auto &batch = batches_.at(static_cast<size_t>(space));
        if (not batch) {
          batch = std::make_unique<InMemoryBatch>(
              *storage_.spaces_.at(static_cast<size_t>(space)));
        }
        return *batch;
      }

      // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
      InMemorySpacedStorage &storage_;
      std::array<std::unique_ptr<InMemoryBatch>, SpacesCount> batches_;
    };

    std::array<std::shared_ptr<InMemoryStorage>, SpacesCount> spaces_;
    std::mutex commit_mutex_;
  };

}  // namespace weave::storage
