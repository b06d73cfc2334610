/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace weave::storage {

  /// Pending writes for one InMemoryStorage; std::nullopt marks a removal
  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      entries.insert_or_assign(ByteVec{key}, std::move(value).intoByteVec());
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      entries.insert_or_assign(ByteVec{key}, std::nullopt);
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[key, value] : entries) {
        if (value.has_value()) {
          OUTCOME_TRY(db.put(key, ByteView{*value}));
        } else {
          OUTCOME_TRY(db.remove(key));
        }
      }
      entries.clear();
      return outcome::success();
    }

    void clear() override {
      entries.clear();
    }

   private:
    std::map<ByteVec, std::optional<ByteVec>, BytewiseLess> entries;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db;
  };
}  // namespace weave::storage
