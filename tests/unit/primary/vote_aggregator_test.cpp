/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/vote_aggregator.hpp"

#include <gtest/gtest.h>

#include "testutil/committee_fixture.hpp"

using Status = weave::primary::VoteAggregator::Status;
using weave::primary::VoteAggregator;

class VoteAggregatorTest : public testing::Test {
 protected:
  testutil::TestCommittee committee_{4};
  VoteAggregator aggregator_{committee_.committee()};
  weave::Header header_ =
      committee_.header(0, 1, committee_.genesisDigests());
};

/**
 * @given a header of authority 0 known to the aggregator
 * @when votes of authorities 0, 1 and 2 arrive
 * @then the third vote forms a certificate signed by all three, sorted
 */
TEST_F(VoteAggregatorTest, QuorumFormsCertificate) {
  EXPECT_FALSE(aggregator_.addHeader(header_).has_value());

  EXPECT_EQ(aggregator_.append(committee_.vote(2, header_)).status,
            Status::Pending);
  EXPECT_EQ(aggregator_.append(committee_.vote(0, header_)).status,
            Status::Pending);
  auto result = aggregator_.append(committee_.vote(1, header_));
  ASSERT_EQ(result.status, Status::QuorumReached);
  ASSERT_TRUE(result.certificate.has_value());

  auto &certificate = result.certificate.value();
  EXPECT_EQ(certificate.header, header_);
  ASSERT_EQ(certificate.signers.size(), 3);
  EXPECT_EQ(certificate.signers[0], committee_[0].id);
  EXPECT_EQ(certificate.signers[2], committee_[2].id);
  EXPECT_TRUE(weave::crypto::ed25519::verify(
      certificate.signatures[1], certificate.digest(), committee_[1].id));

  // late vote after the certificate
  EXPECT_EQ(aggregator_.append(committee_.vote(3, header_)).status,
            Status::Duplicate);
}

/**
 * @given quorum of votes gathered before the header itself is known
 * @when the header is added
 * @then the certificate is formed right away
 */
TEST_F(VoteAggregatorTest, HeaderAfterVotes) {
  for (size_t voter : {1, 2, 3}) {
    EXPECT_EQ(aggregator_.append(committee_.vote(voter, header_)).status,
              Status::Pending);
  }
  auto certificate = aggregator_.addHeader(header_);
  ASSERT_TRUE(certificate.has_value());
  EXPECT_EQ(certificate->signers.size(), 3);
  EXPECT_FALSE(aggregator_.addHeader(header_).has_value());
}

TEST_F(VoteAggregatorTest, QuorumMinusOneWaits) {
  aggregator_.addHeader(header_);
  aggregator_.append(committee_.vote(0, header_));
  EXPECT_EQ(aggregator_.append(committee_.vote(1, header_)).status,
            Status::Pending);
  EXPECT_EQ(aggregator_.append(committee_.vote(1, header_)).status,
            Status::Duplicate);
}

/**
 * @given a vote of authority 1 for one header of origin 0 at round 1
 * @when authority 1 votes for another header of the same slot
 * @then it is an equivocation carrying the first vote, and it is not
 * counted
 */
TEST_F(VoteAggregatorTest, VoterEquivocation) {
  auto other = committee_.header(
      0, 1, committee_.genesisDigests(), {testutil::testBatch(4)});
  auto first = committee_.vote(1, header_);
  aggregator_.append(first);

  auto result = aggregator_.append(committee_.vote(1, other));
  EXPECT_EQ(result.status, Status::Equivocation);
  ASSERT_TRUE(result.previous.has_value());
  EXPECT_EQ(result.previous.value(), first);
}

TEST_F(VoteAggregatorTest, ConflictingDigestFlagged) {
  auto other = committee_.header(
      0, 1, committee_.genesisDigests(), {testutil::testBatch(4)});
  aggregator_.addHeader(header_);
  EXPECT_FALSE(aggregator_.append(committee_.vote(1, header_))
                   .conflicting_digest);
  auto result = aggregator_.append(committee_.vote(2, other));
  EXPECT_EQ(result.status, Status::Pending);
  EXPECT_TRUE(result.conflicting_digest);
}

/**
 * @given an origin excluded at round 1 after it equivocated
 * @then its votes are only counted as Excluded and no certificate forms
 */
TEST_F(VoteAggregatorTest, ExcludedOriginNeverCertified) {
  aggregator_.addHeader(header_);
  aggregator_.append(committee_.vote(0, header_));
  aggregator_.exclude(committee_[0].id, 1);

  for (size_t voter : {1, 2, 3}) {
    auto result = aggregator_.append(committee_.vote(voter, header_));
    EXPECT_EQ(result.status, Status::Excluded);
    EXPECT_FALSE(result.certificate.has_value());
  }
  EXPECT_FALSE(aggregator_.addHeader(header_).has_value());
}

TEST_F(VoteAggregatorTest, MarkCertifiedDropsVotes) {
  aggregator_.append(committee_.vote(1, header_));
  aggregator_.markCertified(committee_[0].id, 1);
  EXPECT_EQ(aggregator_.append(committee_.vote(2, header_)).status,
            Status::Duplicate);
  EXPECT_FALSE(aggregator_.addHeader(header_).has_value());
}

/**
 * @given slots at rounds 1 and 2
 * @when garbage up to round 1 is collected
 * @then round 1 slots are dropped and later votes for it are stale
 */
TEST_F(VoteAggregatorTest, CollectGarbage) {
  auto next = committee_.header(1, 2, {header_.digest()});
  aggregator_.append(committee_.vote(1, header_));
  aggregator_.append(committee_.vote(2, next));
  EXPECT_EQ(aggregator_.size(), 2);

  aggregator_.collectGarbage(1);
  EXPECT_EQ(aggregator_.size(), 1);
  EXPECT_EQ(aggregator_.append(committee_.vote(3, header_)).status,
            Status::Stale);
  EXPECT_FALSE(aggregator_.addHeader(header_).has_value());
  EXPECT_EQ(aggregator_.append(committee_.vote(3, next)).status,
            Status::Pending);
}
