/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/evidence_log.hpp"

#include <gtest/gtest.h>

#include "testutil/committee_fixture.hpp"
#include "testutil/prepare_loggers.hpp"

using weave::primary::Evidence;
using weave::primary::EvidenceLog;

class EvidenceLogTest : public testing::Test {
 protected:
  Evidence headersOf(size_t author, weave::Round round) const {
    auto parents = committee_.genesisDigests();
    return Evidence::headers(
        committee_.header(author, round, parents),
        committee_.header(author, round, parents, {testutil::testBatch(1)}));
  }

  testutil::TestCommittee committee_{4};
};

/**
 * @given two headers of one author for one round
 * @when the evidence is recorded twice
 * @then only the first record is kept
 */
TEST_F(EvidenceLogTest, OneEntryPerSlot) {
  EvidenceLog log(testutil::prepareLoggers(), committee_.committee());
  EXPECT_TRUE(log.record(headersOf(2, 1)));
  EXPECT_FALSE(log.record(headersOf(2, 1)));
  EXPECT_EQ(log.size(), 1);
  EXPECT_TRUE(log.has(committee_[2].id, 1));
  EXPECT_FALSE(log.has(committee_[2].id, 2));
  EXPECT_FALSE(log.has(committee_[1].id, 1));

  auto found = log.forAuthor(committee_[2].id);
  ASSERT_EQ(found.size(), 1);
  EXPECT_EQ(found[0].kind, Evidence::Kind::Headers);
  auto proof = std::get_if<std::pair<weave::Header, weave::Header>>(
      &found[0].proof);
  ASSERT_NE(proof, nullptr);
  EXPECT_NE(proof->first.digest(), proof->second.digest());
}

TEST_F(EvidenceLogTest, KindsAreSeparate) {
  EvidenceLog log(testutil::prepareLoggers(), committee_.committee());
  auto parents = committee_.genesisDigests();
  auto a = committee_.header(0, 1, parents);
  auto b = committee_.header(0, 1, parents, {testutil::testBatch(2)});

  EXPECT_TRUE(log.record(Evidence::votes(committee_.vote(3, a),
                                         committee_.vote(3, b))));
  EXPECT_TRUE(log.record(headersOf(3, 1)));
  EXPECT_TRUE(log.record(
      Evidence::certificates(committee_.certificate(a),
                             committee_.certificate(b))));
  EXPECT_EQ(log.size(), 3);
  EXPECT_EQ(log.forAuthor(committee_[3].id).size(), 2);
  EXPECT_EQ(log.forAuthor(committee_[0].id).front().kind,
            Evidence::Kind::Certificates);
}

/**
 * @given a log of capacity 2
 * @when a third entry is recorded
 * @then the oldest entry leaves and may be recorded again
 */
TEST_F(EvidenceLogTest, BoundedOldestFirst) {
  EvidenceLog log(testutil::prepareLoggers(), committee_.committee(), 2);
  log.record(headersOf(0, 1));
  log.record(headersOf(1, 1));
  log.record(headersOf(2, 1));
  EXPECT_EQ(log.size(), 2);
  EXPECT_FALSE(log.has(committee_[0].id, 1));
  EXPECT_TRUE(log.has(committee_[2].id, 1));
  EXPECT_TRUE(log.record(headersOf(0, 1)));
}
