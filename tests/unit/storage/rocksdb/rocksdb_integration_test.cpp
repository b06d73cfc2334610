/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "storage/storage_error.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"

using qtils::ByteVec;
using weave::storage::Space;
using weave::storage::StorageError;

struct RocksDb_Integration_Test : public test::BaseRocksDB_Test {
  RocksDb_Integration_Test()
      : BaseRocksDB_Test("/tmp/weave-test-rocksdb-integration") {}

  ByteVec key_{1, 3, 3, 7};
  ByteVec value_{1, 2, 3};
};

/**
 * @given opened database
 * @when put {key} with {value}
 * @then {key}'s value is {value}, and it is gone after removal
 */
TEST_F(RocksDb_Integration_Test, PutGetRemove) {
  ASSERT_OUTCOME_SUCCESS_TRY(db_->put(key_, ByteVec{value_}));
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_TRUE(contains);
  ASSERT_OUTCOME_SUCCESS(value, db_->get(key_));
  EXPECT_EQ(std::move(value).intoByteVec(), value_);

  ASSERT_OUTCOME_SUCCESS_TRY(db_->remove(key_));
  ASSERT_OUTCOME_SUCCESS(absent, db_->tryGet(key_));
  EXPECT_FALSE(absent.has_value());
  ASSERT_OUTCOME_ERROR(db_->get(key_), StorageError::NOT_FOUND);
}

/**
 * @given keys written out of order
 * @when a cursor walks the space
 * @then keys come back in byte order, which the round-prefixed indexes rely
 * on
 */
TEST_F(RocksDb_Integration_Test, CursorOrder) {
  std::vector<ByteVec> keys{{0, 2}, {0, 0, 9}, {1}, {0, 1}};
  for (auto &key : keys) {
    ASSERT_OUTCOME_SUCCESS_TRY(db_->put(key, ByteVec{key}));
  }
  std::ranges::sort(keys);

  auto cursor = db_->cursor();
  ASSERT_OUTCOME_SUCCESS(found, cursor->seekFirst());
  ASSERT_TRUE(found);
  std::vector<ByteVec> walked;
  while (cursor->isValid()) {
    walked.push_back(cursor->key().value());
    ASSERT_OUTCOME_SUCCESS_TRY(cursor->next());
  }
  EXPECT_EQ(walked, keys);

  ASSERT_OUTCOME_SUCCESS(seeked, cursor->seek(ByteVec{0, 1, 5}));
  ASSERT_TRUE(seeked);
  EXPECT_EQ(cursor->key(), (ByteVec{0, 2}));
}

/**
 * @given a spaced batch writing to two spaces and removing from a third
 * @then nothing is visible before commit and everything after it
 */
TEST_F(RocksDb_Integration_Test, SpacedBatchIsAtomic) {
  auto headers = rocks_->getSpace(Space::Headers);
  auto certificates = rocks_->getSpace(Space::Certificates);
  ASSERT_OUTCOME_SUCCESS_TRY(db_->put(key_, ByteVec{value_}));

  auto batch = rocks_->createBatch();
  ASSERT_OUTCOME_SUCCESS_TRY(batch->put(Space::Headers, key_, ByteVec{1}));
  ASSERT_OUTCOME_SUCCESS_TRY(
      batch->put(Space::Certificates, key_, ByteVec{2}));
  ASSERT_OUTCOME_SUCCESS_TRY(batch->remove(Space::Default, key_));

  ASSERT_OUTCOME_SUCCESS(before, headers->contains(key_));
  EXPECT_FALSE(before);

  ASSERT_OUTCOME_SUCCESS_TRY(batch->commit());
  ASSERT_OUTCOME_SUCCESS(header, headers->get(key_));
  EXPECT_EQ(std::move(header).intoByteVec(), ByteVec{1});
  ASSERT_OUTCOME_SUCCESS(certificate, certificates->get(key_));
  EXPECT_EQ(std::move(certificate).intoByteVec(), ByteVec{2});
  ASSERT_OUTCOME_SUCCESS(removed, db_->contains(key_));
  EXPECT_FALSE(removed);
}

TEST_F(RocksDb_Integration_Test, SpacesAreSeparate) {
  ASSERT_OUTCOME_SUCCESS_TRY(
      rocks_->getSpace(Space::OwnHeaders)->put(key_, ByteVec{value_}));
  ASSERT_OUTCOME_SUCCESS(other,
                         rocks_->getSpace(Space::LastVoted)->contains(key_));
  EXPECT_FALSE(other);
}

/**
 * @given a value written before the database is closed
 * @when it is opened again
 * @then the value is still there
 */
TEST_F(RocksDb_Integration_Test, SurvivesReopen) {
  ASSERT_OUTCOME_SUCCESS_TRY(db_->put(key_, ByteVec{value_}));
  open();
  ASSERT_OUTCOME_SUCCESS(value, db_->tryGet(key_));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::move(value.value()).intoByteVec(), value_);
}
