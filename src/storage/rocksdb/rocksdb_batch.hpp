/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace weave::storage {

  /**
   * One rocksdb::WriteBatch, usable both as a spaced batch and as a batch
   * over a single column (the one given at construction).
   */
  class RocksDbBatch : public BufferSpacedBatch, public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(std::shared_ptr<RocksDb> db,
                 rocksdb::ColumnFamilyHandle *default_cf,
                 log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> put(Space space,
                              const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    outcome::result<void> remove(Space space, const ByteView &key) override;

   private:
    std::shared_ptr<RocksDb> db_;
    rocksdb::ColumnFamilyHandle *default_cf_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };
}  // namespace weave::storage
