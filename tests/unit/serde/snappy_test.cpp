/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/snappy.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

TEST(SnappyTest, Raw) {
  qtils::ByteVec uncompressed(4096, 0x5a);
  auto compressed = weave::snappyCompress(uncompressed);
  EXPECT_LT(compressed.size(), uncompressed.size());
  ASSERT_OUTCOME_SUCCESS(uncompressed2, weave::snappyUncompress(compressed));
  EXPECT_EQ(uncompressed2, uncompressed);
}

TEST(SnappyTest, DeclaredLengthAboveLimit) {
  qtils::ByteVec uncompressed(1024, 1);
  auto compressed = weave::snappyCompress(uncompressed);
  ASSERT_OUTCOME_ERROR(weave::snappyUncompress(compressed, 1023),
                       weave::SnappyError::UNCOMPRESS_TOO_LONG);
}

TEST(SnappyTest, Corrupted) {
  auto compressed = weave::snappyCompress(qtils::ByteVec(100, 7));
  compressed.resize(compressed.size() / 2);
  ASSERT_OUTCOME_ERROR(weave::snappyUncompress(compressed),
                       weave::SnappyError::UNCOMPRESS_INVALID);
}
