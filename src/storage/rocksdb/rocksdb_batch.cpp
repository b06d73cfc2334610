/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include <boost/assert.hpp>

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace weave::storage {

  RocksDbBatch::RocksDbBatch(std::shared_ptr<RocksDb> db,
                             rocksdb::ColumnFamilyHandle *default_cf,
                             log::Logger logger)
      : db_(std::move(db)),
        default_cf_(default_cf),
        logger_(std::move(logger)) {
    BOOST_ASSERT(db_ != nullptr);
    BOOST_ASSERT(default_cf_ != nullptr);
  }

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    return status_as_result(
        batch_.Put(default_cf_, make_slice(key), make_slice(std::move(value))),
        logger_);
  }

  outcome::result<void> RocksDbBatch::put(Space space,
                                          const ByteView &key,
                                          ByteVecOrView &&value) {
    return status_as_result(batch_.Put(db_->getCFHandle(space),
                                       make_slice(key),
                                       make_slice(std::move(value))),
                            logger_);
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    return status_as_result(batch_.Delete(default_cf_, make_slice(key)),
                            logger_);
  }

  outcome::result<void> RocksDbBatch::remove(Space space,
                                             const ByteView &key) {
    return status_as_result(
        batch_.Delete(db_->getCFHandle(space), make_slice(key)), logger_);
  }

  outcome::result<void> RocksDbBatch::commit() {
    OUTCOME_TRY(status_as_result(db_->db_->Write(db_->wo_, &batch_), logger_));
    batch_.Clear();
    return outcome::success();
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }
}  // namespace weave::storage
