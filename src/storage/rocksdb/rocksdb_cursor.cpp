/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace weave::storage {

  RocksDBCursor::RocksDBCursor(std::unique_ptr<rocksdb::Iterator> it)
      : i_{std::move(it)} {}

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    return isValid();
  }

  outcome::result<bool> RocksDBCursor::seek(const ByteView &key) {
    i_->Seek(make_slice(key));
    return isValid();
  }

  outcome::result<bool> RocksDBCursor::seekLast() {
    i_->SeekToLast();
    return isValid();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    if (i_->Valid()) {
      i_->Next();
    }
    return status_as_result(i_->status());
  }

  outcome::result<void> RocksDBCursor::prev() {
    if (i_->Valid()) {
      i_->Prev();
    }
    return status_as_result(i_->status());
  }

  std::optional<ByteVec> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<ByteVecOrView> RocksDBCursor::value() const {
    return isValid() ? std::make_optional(make_buffer(i_->value()))
                     : std::nullopt;
  }
}  // namespace weave::storage
