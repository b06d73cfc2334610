/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace weave::storage {

  /**
   * Cursor over InMemoryStorage. It keeps a copy of the current entry and
   * re-finds its position on every step, so concurrent writes never
   * invalidate it.
   */
  class InMemoryCursor : public BufferStorageCursor {
   public:
    explicit InMemoryCursor(InMemoryStorage &db) : db{db} {}

    outcome::result<bool> seekFirst() override {
      std::shared_lock lock(db.mutex_);
      return assign(db.storage_.begin());
    }

    outcome::result<bool> seek(const ByteView &key) override {
      std::shared_lock lock(db.mutex_);
      return assign(db.storage_.lower_bound(key));
    }

    outcome::result<bool> seekLast() override {
      std::shared_lock lock(db.mutex_);
      return assign(db.storage_.empty() ? db.storage_.end()
                                        : std::prev(db.storage_.end()));
    }

    bool isValid() const override {
      return kv.has_value();
    }

    outcome::result<void> next() override {
      if (kv) {
        std::shared_lock lock(db.mutex_);
        assign(db.storage_.upper_bound(ByteView{kv->first}));
      }
      return outcome::success();
    }

    outcome::result<void> prev() override {
      if (kv) {
        std::shared_lock lock(db.mutex_);
        auto it = db.storage_.lower_bound(ByteView{kv->first});
        assign(it == db.storage_.begin() ? db.storage_.end() : std::prev(it));
      }
      return outcome::success();
    }

    std::optional<ByteVec> key() const override {
      if (kv) {
        return kv->first;
      }
      return std::nullopt;
    }

    std::optional<ByteVecOrView> value() const override {
      if (kv) {
        return ByteView{kv->second};
      }
      return std::nullopt;
    }

   private:
    bool assign(InMemoryStorage::Map::const_iterator it) {
      if (it == db.storage_.end()) {
        kv.reset();
      } else {
        kv.emplace(it->first, it->second);
      }
      return isValid();
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db;
    std::optional<std::pair<ByteVec, ByteVec>> kv;
  };
}  // namespace weave::storage
