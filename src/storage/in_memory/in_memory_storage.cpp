/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <boost/assert.hpp>

#include "storage/in_memory/cursor.hpp"
#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace weave::storage {

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    std::shared_lock lock(mutex_);
    auto it = storage_.find(key);
    if (it == storage_.end()) {
      return std::nullopt;
    }
    // copy: a view could dangle once the lock is released
    return ByteVecOrView{ByteVec{it->second}};
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    std::unique_lock lock(mutex_);
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      BOOST_ASSERT(size_ >= it->second.size());
      size_ -= it->second.size();
      size_ += value.size();
      it->second = std::move(value).intoByteVec();
      return outcome::success();
    }
    size_ += value.size();
    storage_.emplace(ByteVec{key}, std::move(value).intoByteVec());
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    std::shared_lock lock(mutex_);
    return storage_.find(key) != storage_.end();
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    std::unique_lock lock(mutex_);
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      size_ -= it->second.size();
      storage_.erase(it);
    }
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  std::unique_ptr<InMemoryStorage::Cursor> InMemoryStorage::cursor() {
    return std::make_unique<InMemoryCursor>(*this);
  }

  std::optional<size_t> InMemoryStorage::byteSizeHint() const {
    std::shared_lock lock(mutex_);
    return size_;
  }
}  // namespace weave::storage
