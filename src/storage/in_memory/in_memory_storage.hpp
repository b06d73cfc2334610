/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace weave::storage {

  /// Bytewise ordering, same as RocksDB's default comparator
  struct BytewiseLess {
    using is_transparent = void;

    bool operator()(ByteView lhs, ByteView rhs) const {
      return std::ranges::lexicographical_compare(lhs, rhs);
    }
  };

  /**
   * Map kept in memory. Used by tests and by nodes started without a
   * database directory. Safe to use from several threads.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    std::unique_ptr<Cursor> cursor() override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

   private:
    using Map = std::map<ByteVec, ByteVec, BytewiseLess>;

    mutable std::shared_mutex mutex_;
    Map storage_;
    size_t size_ = 0;

    friend class InMemoryCursor;
  };

}  // namespace weave::storage
